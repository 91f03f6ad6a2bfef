#pragma once

// Sample expressions covering the supported forms
inline constexpr const char* EXAMPLES[] = {
   // Basic
   "(x + y)",
   "(α + β)",
   "(/ x y)",
   "(^ x 2)",
   "(+ (* 2 x) (/ y z))",
   // Calculus
   "(@INTEGRAL 0 1 x^2 x)",
   "(@INTEGRAL 0 1 (@INTEGRAL 0 y x^2 x) y)",
   "(@DERIV x 1 (^ x 2))",
   "(@DERIV x 2 (@PARENS (*x y)))",
   "(@PART_DERIV x 1 (@PARENS (+ x y)))",
   "(@LIMIT x 0 (@PARENS (/ (^ x 2) x)))",
   "(@LIMIT x 0 @RIGHT_HAND (/ 1 x))",
   "(@SUM (@IS i 1) 10 i^2)",
   "(@PRODUCT (@IS i 1) n i)",
   "(@NTHROOT 2 x)",
   "(@NTHROOT 3 x)",
   // Functions
   "(@APPLY sin (@ARGS x))",
   "(@APPLY ln (@ARGS x))",
   "(@APPLY abs (@ARGS x))",
   // Relations
   "(@IS (^ x 2) (* y z))",
   "(@LEQ x y)",
   "(@GEQ x y)",
   "(@EQ F (* m a))",
   // Units and constants
   "(@SCALE 9.81 (/ m (^ s 2)))",
   "(@RSCALE (@PARENS (* 2 x)) (@LABEL UNIT N))",
   "(@LABEL CONSTANT (@ID ε (@SUB 0)))",
   // Matrices and evaluations
   "(@MATRIX 2 2 a b c d)",
   "(@SYM_EVAL (+ x x) (@KW_STACK) (* 2 x))",
   "(/ (@LABEL CONSTANT h) (* 2 (@LABEL CONSTANT π)))",
};
