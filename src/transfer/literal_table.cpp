#include "rft/transfer/literal_table.hpp"

namespace rft::transfer {
namespace {

std::string pad(std::size_t depth) {
    return std::string(depth, ' ');
}

// Double-quoted PowerShell string. Only $env: references stay expandable.
std::string quote(const std::string& text) {
    std::string out = "\"";
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '`' || c == '"' || (c == '$' && text.compare(i, 5, "$env:") != 0)) {
            out.push_back('`');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

LiteralValue& LiteralValue::add(std::string key, LiteralValue value) {
    if (!is_table_) {
        is_table_ = true;
        text_.clear();
    }
    keys_.push_back(std::move(key));
    values_.push_back(std::move(value));
    return *this;
}

const LiteralValue* LiteralValue::find(const std::string& key) const {
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (keys_[i] == key) {
            return &values_[i];
        }
    }
    return nullptr;
}

std::string render_literal(const LiteralValue& value, std::size_t depth) {
    if (!value.is_table()) {
        return quote(value.text());
    }

    std::string out = "@{\n";
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (i > 0) {
            out += ";\n";
        }
        out += pad(depth + 2);
        out += quote(value.keys()[i]);
        out += " = ";
        out += render_literal(value.values()[i], depth + 2);
    }
    out += "\n";
    out += pad(depth);
    out += "}";
    return out;
}

} // namespace rft::transfer
