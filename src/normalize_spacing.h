#pragma once

#include <string>

/// Inserts a space after Greek letter commands and other control words that
/// are glued to a following identifier character, e.g. "\pix" -> "\pi x",
/// "\alpha2" -> "\alpha 2". \int, \sum, \prod, \lim, \frac, \sqrt and \in are
/// left alone.
std::string normalize_spacing(const std::string& latex);
