#include <orginline-cpp/entity.hpp>

#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace orginline_cpp {

namespace {

struct EntityRow {
    const char* name;
    const char* latex;
    bool latex_math;
    const char* html;
    const char* ascii;
    const char* unicode;
};

// Common org entity names: letters, punctuation and typography, arrows,
// and the mathematical symbols used in running text.
constexpr EntityRow default_rows[] = {
    // Greek, lower case
    {"alpha",   "\\alpha",   true, "&alpha;",   "alpha",   "α"},
    {"beta",    "\\beta",    true, "&beta;",    "beta",    "β"},
    {"gamma",   "\\gamma",   true, "&gamma;",   "gamma",   "γ"},
    {"delta",   "\\delta",   true, "&delta;",   "delta",   "δ"},
    {"epsilon", "\\epsilon", true, "&epsilon;", "epsilon", "ε"},
    {"zeta",    "\\zeta",    true, "&zeta;",    "zeta",    "ζ"},
    {"eta",     "\\eta",     true, "&eta;",     "eta",     "η"},
    {"theta",   "\\theta",   true, "&theta;",   "theta",   "θ"},
    {"iota",    "\\iota",    true, "&iota;",    "iota",    "ι"},
    {"kappa",   "\\kappa",   true, "&kappa;",   "kappa",   "κ"},
    {"lambda",  "\\lambda",  true, "&lambda;",  "lambda",  "λ"},
    {"mu",      "\\mu",      true, "&mu;",      "mu",      "μ"},
    {"nu",      "\\nu",      true, "&nu;",      "nu",      "ν"},
    {"xi",      "\\xi",      true, "&xi;",      "xi",      "ξ"},
    {"omicron", "\\textit{o}", false, "&omicron;", "omicron", "ο"},
    {"pi",      "\\pi",      true, "&pi;",      "pi",      "π"},
    {"rho",     "\\rho",     true, "&rho;",     "rho",     "ρ"},
    {"sigma",   "\\sigma",   true, "&sigma;",   "sigma",   "σ"},
    {"sigmaf",  "\\varsigma", true, "&sigmaf;", "sigmaf",  "ς"},
    {"tau",     "\\tau",     true, "&tau;",     "tau",     "τ"},
    {"upsilon", "\\upsilon", true, "&upsilon;", "upsilon", "υ"},
    {"phi",     "\\phi",     true, "&phi;",     "phi",     "φ"},
    {"chi",     "\\chi",     true, "&chi;",     "chi",     "χ"},
    {"psi",     "\\psi",     true, "&psi;",     "psi",     "ψ"},
    {"omega",   "\\omega",   true, "&omega;",   "omega",   "ω"},
    // Greek, upper case
    {"Alpha",   "A",         false, "&Alpha;",  "Alpha",   "Α"},
    {"Beta",    "B",         false, "&Beta;",   "Beta",    "Β"},
    {"Gamma",   "\\Gamma",   true, "&Gamma;",   "Gamma",   "Γ"},
    {"Delta",   "\\Delta",   true, "&Delta;",   "Delta",   "Δ"},
    {"Theta",   "\\Theta",   true, "&Theta;",   "Theta",   "Θ"},
    {"Lambda",  "\\Lambda",  true, "&Lambda;",  "Lambda",  "Λ"},
    {"Xi",      "\\Xi",      true, "&Xi;",      "Xi",      "Ξ"},
    {"Pi",      "\\Pi",      true, "&Pi;",      "Pi",      "Π"},
    {"Sigma",   "\\Sigma",   true, "&Sigma;",   "Sigma",   "Σ"},
    {"Upsilon", "\\Upsilon", true, "&Upsilon;", "Upsilon", "Υ"},
    {"Phi",     "\\Phi",     true, "&Phi;",     "Phi",     "Φ"},
    {"Psi",     "\\Psi",     true, "&Psi;",     "Psi",     "Ψ"},
    {"Omega",   "\\Omega",   true, "&Omega;",   "Omega",   "Ω"},
    // Punctuation and typography
    {"nbsp",    "~",          false, "&nbsp;",   " ",   " "},
    {"ndash",   "--",         false, "&ndash;",  "-",   "–"},
    {"mdash",   "---",        false, "&mdash;",  "--",  "—"},
    {"hellip",  "\\dots{}",   false, "&hellip;", "...", "…"},
    {"dots",    "\\dots{}",   false, "&hellip;", "...", "…"},
    {"laquo",   "\\guillemotleft{}",  false, "&laquo;", "<<", "«"},
    {"raquo",   "\\guillemotright{}", false, "&raquo;", ">>", "»"},
    {"lsquo",   "\\textquoteleft{}",  false, "&lsquo;", "`",  "‘"},
    {"rsquo",   "\\textquoteright{}", false, "&rsquo;", "'",  "’"},
    {"ldquo",   "\\textquotedblleft{}",  false, "&ldquo;", "\"", "“"},
    {"rdquo",   "\\textquotedblright{}", false, "&rdquo;", "\"", "”"},
    {"bull",    "\\textbullet{}", false, "&bull;",   "*",   "•"},
    {"dagger",  "\\textdagger{}", false, "&dagger;", "[dagger]", "†"},
    {"Dagger",  "\\textdaggerdbl{}", false, "&Dagger;", "[doubledagger]", "‡"},
    {"sect",    "\\S",        false, "&sect;",   "paragraph", "§"},
    {"para",    "\\P{}",      false, "&para;",   "[pilcrow]", "¶"},
    {"copy",    "\\textcopyright{}", false, "&copy;", "(c)", "©"},
    {"reg",     "\\textregistered{}", false, "&reg;", "(r)", "®"},
    {"trade",   "\\texttrademark{}", false, "&trade;", "TM", "™"},
    {"deg",     "\\textdegree{}", false, "&deg;", "degree", "°"},
    {"amp",     "\\&",        false, "&amp;",    "&",   "&"},
    {"lt",      "\\textless{}",    false, "&lt;", "<", "<"},
    {"gt",      "\\textgreater{}", false, "&gt;", ">", ">"},
    {"backslash", "\\textbackslash{}", false, "&#92;", "\\", "\\"},
    {"euro",    "\\texteuro{}", false, "&euro;", "EUR", "€"},
    {"pound",   "\\pounds{}", false, "&pound;",  "GBP", "£"},
    {"yen",     "\\textyen{}", false, "&yen;",   "JPY", "¥"},
    {"cent",    "\\textcent{}", false, "&cent;", "cent", "¢"},
    // Arrows
    {"larr",    "\\leftarrow",      true, "&larr;", "<-",  "←"},
    {"rarr",    "\\rightarrow",     true, "&rarr;", "->",  "→"},
    {"uarr",    "\\uparrow",        true, "&uarr;", "^",   "↑"},
    {"darr",    "\\downarrow",      true, "&darr;", "v",   "↓"},
    {"harr",    "\\leftrightarrow", true, "&harr;", "<->", "↔"},
    {"lArr",    "\\Leftarrow",      true, "&lArr;", "<=",  "⇐"},
    {"rArr",    "\\Rightarrow",     true, "&rArr;", "=>",  "⇒"},
    {"hArr",    "\\Leftrightarrow", true, "&hArr;", "<=>", "⇔"},
    {"to",      "\\to",             true, "&rarr;", "->",  "→"},
    {"gets",    "\\gets",           true, "&larr;", "<-",  "←"},
    // Mathematics
    {"pm",      "\\pm",       true, "&plusmn;", "+-",  "±"},
    {"plusmn",  "\\pm",       true, "&plusmn;", "+-",  "±"},
    {"times",   "\\times",    true, "&times;",  "*",   "×"},
    {"div",     "\\div",      true, "&divide;", "/",   "÷"},
    {"le",      "\\le",       true, "&le;",     "<=",  "≤"},
    {"leq",     "\\le",       true, "&le;",     "<=",  "≤"},
    {"ge",      "\\ge",       true, "&ge;",     ">=",  "≥"},
    {"geq",     "\\ge",       true, "&ge;",     ">=",  "≥"},
    {"ne",      "\\ne",       true, "&ne;",     "[not equal]", "≠"},
    {"neq",     "\\ne",       true, "&ne;",     "[not equal]", "≠"},
    {"approx",  "\\approx",   true, "&asymp;",  "[approximately equal]", "≈"},
    {"equiv",   "\\equiv",    true, "&equiv;",  "[equivalent]", "≡"},
    {"infin",   "\\infty",    true, "&infin;",  "[infinity]", "∞"},
    {"infty",   "\\infty",    true, "&infin;",  "[infinity]", "∞"},
    {"sum",     "\\sum",      true, "&sum;",    "[sum]", "∑"},
    {"prod",    "\\prod",     true, "&prod;",   "[product]", "∏"},
    {"radic",   "\\sqrt{\\,}", true, "&radic;", "[square root]", "√"},
    {"sqrt",    "\\sqrt{\\,}", true, "&radic;", "[square root]", "√"},
    {"partial", "\\partial",  true, "&part;",   "[partial differential]", "∂"},
    {"nabla",   "\\nabla",    true, "&nabla;",  "[nabla]", "∇"},
    {"forall",  "\\forall",   true, "&forall;", "[for all]", "∀"},
    {"exist",   "\\exists",   true, "&exist;",  "[there exists]", "∃"},
    {"exists",  "\\exists",   true, "&exist;",  "[there exists]", "∃"},
    {"empty",   "\\emptyset", true, "&empty;",  "[empty set]", "∅"},
    {"isin",    "\\in",       true, "&isin;",   "[element of]", "∈"},
    {"in",      "\\in",       true, "&isin;",   "[element of]", "∈"},
    {"notin",   "\\notin",    true, "&notin;",  "[not an element of]", "∉"},
    {"sub",     "\\subset",   true, "&sub;",    "[subset of]", "⊂"},
    {"sup",     "\\supset",   true, "&sup;",    "[superset of]", "⊃"},
    {"cap",     "\\cap",      true, "&cap;",    "[intersection]", "∩"},
    {"cup",     "\\cup",      true, "&cup;",    "[union]", "∪"},
    {"and",     "\\wedge",    true, "&and;",    "[logical and]", "∧"},
    {"or",      "\\vee",      true, "&or;",     "[logical or]", "∨"},
    {"not",     "\\textlnot{}", false, "&not;", "[angled dash]", "¬"},
    {"int",     "\\int",      true, "&int;",    "[integral]", "∫"},
    {"prop",    "\\propto",   true, "&prop;",   "[proportional to]", "∝"},
    {"middot",  "\\textperiodcentered{}", false, "&middot;", ".", "·"},
    {"prime",   "\\prime",    true, "&prime;",  "'",  "′"},
    {"frac12",  "\\textonehalf{}", false, "&frac12;", "1/2", "½"},
    {"frac14",  "\\textonequarter{}", false, "&frac14;", "1/4", "¼"},
    {"frac34",  "\\textthreequarters{}", false, "&frac34;", "3/4", "¾"},
    // Miscellaneous
    {"smiley",  "\\ddot\\smile", true, "&#9786;", ":-)", "☺"},
    {"check",   "\\checkmark", true, "&#10003;", "[checkmark]", "✓"},
    {"star",    "\\star",     true, "*",        "*",   "⋆"},
};

auto to_entity(const EntityRow& row) -> Entity {
    return Entity{row.name, row.latex, row.latex_math, row.html, row.ascii, row.unicode};
}

}  // anonymous namespace

EntityTable::EntityTable(std::vector<Entity> entities) {
    entities_.reserve(entities.size());
    for (auto& e : entities) {
        auto name = e.name;
        entities_.insert_or_assign(std::move(name), std::move(e));
    }
}

auto EntityTable::defaults() -> std::shared_ptr<const EntityTable> {
    static const auto table = [] {
        auto entities = std::vector<Entity>{};
        entities.reserve(std::size(default_rows));
        for (const auto& row : default_rows) entities.push_back(to_entity(row));
        return std::make_shared<const EntityTable>(std::move(entities));
    }();
    return table;
}

auto EntityTable::empty() -> std::shared_ptr<const EntityTable> {
    static const auto table = std::make_shared<const EntityTable>(std::vector<Entity>{});
    return table;
}

auto EntityTable::lookup(std::string_view name) const -> std::optional<Entity> {
    const auto it = entities_.find(std::string{name});
    if (it == entities_.end()) return std::nullopt;
    return it->second;
}

}  // namespace orginline_cpp
