#pragma once

#include "config.h"

#include <string>

inline constexpr const char* NO_REFINEMENTS_NOTE =
   "  % No further refinements available";

/// Rewrites already generated LaTeX for readability: a/b to \frac, spacing
/// around operators, braced exponents, \left( \right) around fractions,
/// escaped function names, \displaystyle big operators and upright units.
/// If nothing applied and config.annotate_unrefined is set, a LaTeX comment
/// saying so is appended. Applying it again never changes the math.
///
/// Throws InputTooLong if @p latex is longer than config.max_input_length.
std::string refine(const std::string& latex,
                   const TranslatorConfig& config = {});
