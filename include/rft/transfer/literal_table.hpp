#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rft::transfer {

/**
 * @brief Value of a remote hash-table literal: a string or an ordered table
 *
 * Hash-files are read by the remote scripts with a PowerShell hash-table
 * parser, so the rendering below is a wire format. Layout:
 *
 *   @{
 *     "key" = "value";
 *     "nested" = @{
 *       "dst" = "C:\dest"
 *     }
 *   }
 *
 * Entries keep insertion order and are separated by ";\n" with no trailing
 * separator. Each nesting level indents by two more spaces.
 */
class LiteralValue {
public:
    /// An empty table.
    LiteralValue() = default;
    LiteralValue(std::string text) : is_table_(false), text_(std::move(text)) {}
    LiteralValue(const char* text) : is_table_(false), text_(text) {}

    /// Appends an entry to a table. Adding to a string value turns it into a table.
    LiteralValue& add(std::string key, LiteralValue value);

    [[nodiscard]] bool is_table() const noexcept { return is_table_; }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] const std::vector<std::string>& keys() const noexcept { return keys_; }
    [[nodiscard]] const std::vector<LiteralValue>& values() const noexcept { return values_; }

    /// Value stored under key, or nullptr.
    [[nodiscard]] const LiteralValue* find(const std::string& key) const;

private:
    bool is_table_ = true;
    std::string text_;
    std::vector<std::string> keys_;
    std::vector<LiteralValue> values_;
};

/**
 * Renders value as a PowerShell hashtable literal. Strings are double-quoted;
 * embedded `, " and $ are escaped with a backtick, except $ starting an
 * $env: reference, which the remote side expands.
 */
std::string render_literal(const LiteralValue& value, std::size_t depth = 0);

} // namespace rft::transfer
