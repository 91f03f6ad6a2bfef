#pragma once

#include <optional>
#include <string>
#include <string_view>

// Maps a source token (UTF-8) to a LaTeX fragment
struct TexSymbol {
	std::string_view source;
	std::string_view tex;
};

inline constexpr std::string_view INFINITY_SYMBOL = "∞";
inline constexpr std::string_view INFINITY_TEX = "\\infty";

inline constexpr TexSymbol GREEK_LETTERS[] = {
   // Lowercase
   {"α", "\\alpha"},
   {"β", "\\beta"},
   {"χ", "\\chi"},
   {"δ", "\\delta"},
   {"ε", "\\epsilon"},
   {"φ", "\\phi"},
   {"ϕ", "\\varphi"},
   {"γ", "\\gamma"},
   {"η", "\\eta"},
   {"ι", "\\iota"},
   {"κ", "\\kappa"},
   {"λ", "\\lambda"},
   {"μ", "\\mu"},
   {"ν", "\\nu"},
   {"ο", "\\omicron"},
   {"π", "\\pi"},
   {"θ", "\\theta"},
   {"ρ", "\\rho"},
   {"σ", "\\sigma"},
   {"τ", "\\tau"},
   {"υ", "\\upsilon"},
   {"ω", "\\omega"},
   {"ξ", "\\xi"},
   {"ψ", "\\psi"},
   {"ζ", "\\zeta"},
   {"ϑ", "\\vartheta"},
   // Uppercase
   {"Α", "\\Alpha"},
   {"Β", "\\Beta"},
   {"Χ", "\\Chi"},
   {"Δ", "\\Delta"},
   {"Ε", "\\Epsilon"},
   {"Φ", "\\Phi"},
   {"Γ", "\\Gamma"},
   {"Η", "\\Eta"},
   {"Ι", "\\Iota"},
   {"Κ", "\\Kappa"},
   {"Λ", "\\Lambda"},
   {"Μ", "\\Mu"},
   {"Ν", "\\Nu"},
   {"Ο", "\\Omicron"},
   {"Π", "\\Pi"},
   {"Θ", "\\Theta"},
   {"Ρ", "\\Rho"},
   {"Σ", "\\Sigma"},
   {"Τ", "\\Tau"},
   {"Υ", "\\Upsilon"},
   {"Ω", "\\Omega"},
   {"Ξ", "\\Xi"},
   {"Ψ", "\\Psi"},
   {"Ζ", "\\Zeta"},
};

inline constexpr TexSymbol SPECIAL_SYMBOLS[] = {
   {"†", "{\\dagger}"},
   {"‡", "{\\ddagger}"},
   {"∗", "^{*}"},
   {"°", "^{\\circ}"},
   {"′", "^{\\prime}"},
   {"″", "^{\\prime\\prime}"},
   {"‴", "^{\\prime\\prime\\prime}"},
};

inline constexpr TexSymbol UNITS[] = {
   // SI base units
   {"m", "\\mathrm{m}"},
   {"kg", "\\mathrm{kg}"},
   {"s", "\\mathrm{s}"},
   {"A", "\\mathrm{A}"},
   {"K", "\\mathrm{K}"},
   {"mol", "\\mathrm{mol}"},
   {"cd", "\\mathrm{cd}"},
   // Derived units, "n" is accepted as newton too
   {"N", "\\mathrm{N}"},
   {"n", "\\mathrm{n}"},
   {"newton", "\\mathrm{N}"},
   {"Pa", "\\mathrm{Pa}"},
   {"J", "\\mathrm{J}"},
   {"W", "\\mathrm{W}"},
   {"C", "\\mathrm{C}"},
   {"V", "\\mathrm{V}"},
   {"F", "\\mathrm{F}"},
   {"Ω", "\\Omega"},
   {"S", "\\mathrm{S}"},
   {"T", "\\mathrm{T}"},
   {"H", "\\mathrm{H}"},
   {"Hz", "\\mathrm{Hz}"},
   // Common non-SI units
   {"min", "\\mathrm{min}"},
   {"h", "\\mathrm{h}"},
   {"day", "\\mathrm{day}"},
   {"deg", "^{\\circ}"},
   {"rad", "\\mathrm{rad}"},
   {"sr", "\\mathrm{sr}"},
   {"L", "\\mathrm{L}"},
   {"g", "\\mathrm{g}"},
   {"t", "\\mathrm{t}"},
   {"eV", "\\mathrm{eV}"},
   {"bar", "\\mathrm{bar}"},
   {"atm", "\\mathrm{atm}"},
   {"in", "\\mathrm{in}"},
   {"ft", "\\mathrm{ft}"},
   {"mi", "\\mathrm{mi}"},
   {"lb", "\\mathrm{lb}"},
};

inline constexpr TexSymbol CONSTANTS[] = {
   // Fundamental constants
   {"c", "c"},                      // speed of light
   {"e_c", "e"},                    // elementary charge
   {"h", "h"},                      // Planck constant
   {"ℏ", "\\hbar"},                 // reduced Planck constant
   {"k", "k_\\mathrm{B}"},          // Boltzmann constant
   {"m_u", "m_\\mathrm{u}"},        // atomic mass constant
   {"N_A", "N_\\mathrm{A}"},        // Avogadro constant
   {"R", "R"},                      // gas constant
   {"R_∞", "R_{\\infty}"},          // Rydberg constant
   {"α", "\\alpha"},                // fine structure constant
   {"γ", "\\gamma"},                // Euler-Mascheroni constant
   {"ε_0", "\\varepsilon_0"},       // vacuum permittivity
   {"μ_0", "\\mu_0"},               // vacuum permeability
   {"σ", "\\sigma"},                // Stefan-Boltzmann constant
   {"Φ_0", "\\Phi_0"},              // magnetic flux quantum
   // Other physical constants
   {"G", "G"},                      // gravitational constant
   {"g", "g"},                      // standard gravity
   {"M_e", "m_\\mathrm{e}"},        // electron mass
   {"M_p", "m_\\mathrm{p}"},        // proton mass
   {"M_n", "m_\\mathrm{n}"},        // neutron mass
   {"q_e", "e"},                    // elementary charge
   {"F", "F"},                      // Faraday constant
   {"n_0", "n_0"},                  // vacuum refractive index
   {"K_J", "K_\\mathrm{J}"},        // Josephson constant
   {"R_K", "R_\\mathrm{K}"},        // von Klitzing constant
   {"μ_B", "\\mu_\\mathrm{B}"},     // Bohr magneton
   {"μ_N", "\\mu_\\mathrm{N}"},     // nuclear magneton
   {"a_0", "a_0"},                  // Bohr radius
   {"E_h", "E_\\mathrm{h}"},        // Hartree energy
   {"λ_C", "\\lambda_\\mathrm{C}"}, // Compton wavelength
};

// "#" in a template is replaced with the argument list instead of appending
// "(args)"
inline constexpr TexSymbol FUNCTIONS[] = {
   {"sin", "\\sin"},
   {"cos", "\\cos"},
   {"tan", "\\tan"},
   {"cot", "\\cot"},
   {"sec", "\\sec"},
   {"csc", "\\csc"},
   {"arcsin", "\\arcsin"},
   {"arccos", "\\arccos"},
   {"arctan", "\\arctan"},
   {"sinh", "\\sinh"},
   {"cosh", "\\cosh"},
   {"tanh", "\\tanh"},
   {"ln", "\\ln"},
   {"log", "\\log"},
   {"log10", "\\log_{10}"},
   {"exp", "\\exp"},
   {"abs", "\\left|#\\right|"},
   {"max", "\\max"},
   {"min", "\\min"},
};

/// Returns the Greek letter or special symbol @p token stands for in full
std::optional<std::string_view> lookup_symbol(std::string_view token);

/// Exact match, then the case-insensitive one. Nullopt if @p name is not a
/// known unit.
std::optional<std::string_view> lookup_unit(std::string_view name);

/// Matches @p name both in its source form ("μ_0") and in the form it has
/// after symbol substitution ("\mu_0").
std::optional<std::string_view> lookup_constant(std::string_view name);

std::optional<std::string_view> lookup_function(std::string_view name);

/// Replaces every Greek letter, special symbol and the infinity glyph in
/// @p text with its LaTeX fragment.
std::string replace_symbols(std::string text);
