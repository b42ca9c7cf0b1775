#pragma once
/*
===============================================================================
DATA STORE — Typed key/value record attached to a Model
===============================================================================

OVERVIEW
--------
A small string-keyed container of type-erased values. The Model uses it to
remember every parameter it forwarded to the solver ("param:TimeLimit",
"param:Preset", ...) so that settings can be inspected after the fact, and
callers may hang their own metadata on the model next to them.

KEY COMPONENTS
--------------
• Value      — std::any wrapper with checked and defaulted access
• DataStore  — ordered map std::string -> Value with lookup helpers

USAGE EXAMPLES
--------------
    mip::DataStore store;
    store["capacity"] = 100;
    store["label"] = std::string("knapsack");

    int cap = store["capacity"].get<int>();
    double gap = store.get_or<double>("param:MIPGap", 1e-4);

    for (const auto& key : model.store().keys()) { ... }

EXCEPTION SAFETY
----------------
• Value::get<T>(): std::bad_any_cast on type mismatch or empty value
• DataStore::at(): std::out_of_range for a missing key

===============================================================================
*/

#include <any>
#include <concepts>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace mip {

    // ========================================================================
    // VALUE
    // ========================================================================
    /**
     * @class Value
     * @brief Type-erased slot of a DataStore
     */
    class Value {
    private:
        std::any storage_;

    public:
        Value() = default;

        template<typename T>
            requires (!std::same_as<std::decay_t<T>, Value>)
        Value(T&& v)
            : storage_(std::forward<T>(v)) {
        }

        template<typename T>
            requires (!std::same_as<std::decay_t<T>, Value>)
        Value& operator=(T&& v) {
            storage_ = std::forward<T>(v);
            return *this;
        }

        [[nodiscard]] bool has_value() const noexcept { return storage_.has_value(); }

        /// @brief True if the stored value is exactly of type T
        template<typename T>
        [[nodiscard]] bool is() const noexcept {
            return storage_.type() == typeid(T);
        }

        template<typename T>
        T& get() { return std::any_cast<T&>(storage_); }

        template<typename T>
        const T& get() const { return std::any_cast<const T&>(storage_); }

        template<typename T>
        std::optional<T> try_get() const {
            if (!is<T>()) return std::nullopt;
            return get<T>();
        }

        template<typename T>
        T get_or(const T& fallback) const {
            return is<T>() ? get<T>() : fallback;
        }

        void reset() noexcept { storage_.reset(); }
    };

    // ========================================================================
    // DATA STORE
    // ========================================================================
    /**
     * @class DataStore
     * @brief String-keyed collection of Values, iterated in key order
     */
    class DataStore {
    private:
        std::map<std::string, Value, std::less<>> entries_;

    public:
        /// @brief Inserts an empty Value when key is absent
        Value& operator[](const std::string& key) { return entries_[key]; }

        const Value& at(const std::string& key) const {
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                throw std::out_of_range("DataStore: no entry named '" + key + "'");
            }
            return it->second;
        }

        [[nodiscard]] bool contains(const std::string& key) const {
            return entries_.contains(key);
        }

        template<typename T>
        std::optional<T> get(const std::string& key) const {
            auto it = entries_.find(key);
            if (it == entries_.end()) return std::nullopt;
            return it->second.try_get<T>();
        }

        template<typename T>
        T get_or(const std::string& key, const T& fallback) const {
            return get<T>(key).value_or(fallback);
        }

        bool erase(const std::string& key) { return entries_.erase(key) > 0; }

        void clear() noexcept { entries_.clear(); }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        [[nodiscard]] std::vector<std::string> keys() const {
            std::vector<std::string> out;
            out.reserve(entries_.size());
            for (const auto& [k, v] : entries_) {
                out.push_back(k);
            }
            return out;
        }
    };

} // namespace mip
