/// @file value.cpp
/// @brief ValueObject and Value container operations

#include <marshal/value/value.hpp>
#include <algorithm>
#include <stdexcept>

namespace marshal_value {

// =============================================================================
// ValueObject
// =============================================================================

ValueObject::ValueObject(std::initializer_list<Entry> entries) {
    m_entries.reserve(entries.size());
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

bool ValueObject::contains(std::string_view key) const noexcept {
    return find(key) != nullptr;
}

const Value* ValueObject::find(std::string_view key) const noexcept {
    for (const auto& [k, v] : m_entries) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

Value* ValueObject::find(std::string_view key) noexcept {
    for (auto& [k, v] : m_entries) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

const Value& ValueObject::at(std::string_view key) const {
    if (const Value* v = find(key)) {
        return *v;
    }
    throw std::out_of_range("ValueObject: no key '" + std::string(key) + "'");
}

Value& ValueObject::set(std::string key, Value value) {
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    m_entries.emplace_back(std::move(key), std::move(value));
    return m_entries.back().second;
}

Value& ValueObject::operator[](const std::string& key) {
    if (Value* existing = find(key)) {
        return *existing;
    }
    m_entries.emplace_back(key, Value{});
    return m_entries.back().second;
}

bool ValueObject::erase(std::string_view key) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
        [key](const Entry& e) { return e.first == key; });
    if (it == m_entries.end()) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

std::vector<std::string> ValueObject::keys() const {
    std::vector<std::string> result;
    result.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        result.push_back(entry.first);
    }
    return result;
}

bool ValueObject::operator==(const ValueObject& other) const {
    if (m_entries.size() != other.m_entries.size()) {
        return false;
    }
    for (const auto& [k, v] : m_entries) {
        const Value* theirs = other.find(k);
        if (!theirs || !(*theirs == v)) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Value
// =============================================================================

std::size_t Value::size() const noexcept {
    if (auto* arr = std::get_if<ValueArray>(&m_data)) {
        return arr->size();
    }
    if (auto* obj = std::get_if<ValueObject>(&m_data)) {
        return obj->size();
    }
    return 0;
}

const Value& Value::operator[](std::size_t index) const {
    return std::get<ValueArray>(m_data).at(index);
}

Value& Value::operator[](std::size_t index) {
    return std::get<ValueArray>(m_data).at(index);
}

const Value& Value::operator[](const std::string& key) const {
    return std::get<ValueObject>(m_data).at(key);
}

Value& Value::operator[](const std::string& key) {
    return std::get<ValueObject>(m_data)[key];
}

bool Value::contains(std::string_view key) const noexcept {
    if (auto* obj = std::get_if<ValueObject>(&m_data)) {
        return obj->contains(key);
    }
    return false;
}

const Value* Value::get(std::string_view key) const noexcept {
    if (auto* obj = std::get_if<ValueObject>(&m_data)) {
        return obj->find(key);
    }
    return nullptr;
}

void Value::push_back(Value value) {
    std::get<ValueArray>(m_data).push_back(std::move(value));
}

} // namespace marshal_value
