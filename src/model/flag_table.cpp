/// @file flag_table.cpp
/// @brief FlagTable implementation

#include <marshal/model/flag_table.hpp>
#include <cctype>
#include <charconv>

namespace marshal_model {

namespace {

const std::string k_empty;

} // anonymous namespace

FlagTable::FlagTable(std::string name)
    : m_name(std::move(name))
{
    add_alias("Nothing", 0u);
    add_alias("Everything", all_bits);
}

marshal_core::Result<void> FlagTable::set_bit_name(std::uint32_t bit, std::string name) {
    if (bit >= bit_count) {
        return marshal_core::Err(marshal_core::Error(marshal_core::ErrorCode::OutOfRange,
            m_name + ": bit index " + std::to_string(bit) + " exceeds " + std::to_string(bit_count - 1)));
    }
    m_bits[bit] = std::move(name);
    return marshal_core::Ok();
}

const std::string& FlagTable::bit_name(std::uint32_t bit) const noexcept {
    if (bit >= bit_count) {
        return k_empty;
    }
    return m_bits[bit];
}

void FlagTable::add_alias(std::string name, std::uint32_t bits) {
    auto key = normalize(name);
    for (auto& alias : m_aliases) {
        if (alias.first == key) {
            alias.second = bits;
            return;
        }
    }
    m_aliases.emplace_back(std::move(key), bits);
}

std::optional<std::uint32_t> FlagTable::resolve(std::string_view token) const {
    auto key = normalize(token);
    if (key.empty()) {
        return std::nullopt;
    }

    for (const auto& [alias, bits] : m_aliases) {
        if (alias == key) {
            return bits;
        }
    }

    for (std::uint32_t bit = 0; bit < bit_count; ++bit) {
        if (!m_bits[bit].empty() && normalize(m_bits[bit]) == key) {
            return 1u << bit;
        }
    }

    // Unnamed bits decode to their index; accept that form back
    std::uint32_t index = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), index);
    if (ec == std::errc{} && ptr == key.data() + key.size() && index < bit_count) {
        return 1u << index;
    }

    return std::nullopt;
}

std::vector<std::string> FlagTable::decode(std::uint32_t bits) const {
    std::vector<std::string> names;
    for (std::uint32_t bit = 0; bit < bit_count; ++bit) {
        if ((bits & (1u << bit)) == 0) {
            continue;
        }
        names.push_back(m_bits[bit].empty() ? std::to_string(bit) : m_bits[bit]);
    }
    return names;
}

std::size_t FlagTable::named_count() const noexcept {
    std::size_t count = 0;
    for (const auto& name : m_bits) {
        if (!name.empty()) {
            ++count;
        }
    }
    return count;
}

FlagTable FlagTable::default_layers() {
    FlagTable table("LayerMask");
    table.m_bits[0] = "Default";
    table.m_bits[1] = "TransparentFX";
    table.m_bits[2] = "Ignore Raycast";
    table.m_bits[4] = "Water";
    table.m_bits[5] = "UI";
    return table;
}

std::string FlagTable::normalize(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(uc)));
    }
    return out;
}

} // namespace marshal_model
