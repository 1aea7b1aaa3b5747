/// @file entity.hpp
/// @brief Named entities (`\alpha`, `\rarr`) and the table that resolves them.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace orginline_cpp {

/// A named symbolic glyph with its renderings for each output family.
struct Entity {
    std::string name;     ///< The name as written after the backslash.
    std::string latex;    ///< LaTeX command producing the glyph.
    bool latex_math{false};  ///< True if `latex` is only valid in math mode.
    std::string html;     ///< HTML character reference.
    std::string ascii;    ///< Closest ASCII rendering.
    std::string unicode;  ///< The glyph itself, UTF-8 encoded.

    auto operator==(const Entity&) const -> bool = default;
};

/// An immutable name -> Entity lookup table.
///
/// Tables are shared between sessions through `std::shared_ptr` and are
/// never mutated after construction, so concurrent lookups are safe.
///
/// @code
/// auto table = EntityTable::defaults();
/// if (auto e = table->lookup("alpha")) {
///     std::printf("%s\n", e->unicode.c_str());
/// }
/// @endcode
class EntityTable {
public:
    /// Build a table from a list of entities. Later duplicates win.
    explicit EntityTable(std::vector<Entity> entities);

    /// The built-in table of common org entity names.
    static auto defaults() -> std::shared_ptr<const EntityTable>;

    /// A table that resolves nothing.
    static auto empty() -> std::shared_ptr<const EntityTable>;

    /// Resolve a name. Returns nullopt for unknown names.
    auto lookup(std::string_view name) const -> std::optional<Entity>;

    /// Number of entities in the table.
    auto size() const -> std::size_t { return entities_.size(); }

private:
    std::unordered_map<std::string, Entity> entities_;
};

}  // namespace orginline_cpp
