#pragma once

#include "config.h"

#include <string>

/// Translates a Mathcad expression in the tagged prefix notation, e.g.
/// "(@INTEGRAL 0 1 x^2 x)", into LaTeX. Unknown or incomplete forms degrade
/// to best-effort text instead of failing.
///
/// Throws InputTooLong if @p input is longer than config.max_input_length,
/// RecursionLimitExceeded if the nesting is deeper than
/// config.max_depth and, with config.strict_nesting, MalformedInput if the
/// parentheses do not balance.
std::string translate(const std::string& input,
                      const TranslatorConfig& config = {});

/// translate() followed by refine()
std::string convert(const std::string& input,
                    const TranslatorConfig& config = {});
