/**
 * @file db.hpp
 * @author Ruan Formigoni
 * @brief A database that interfaces with nlohmann json
 *
 * Serialized records of caerbannog, like the run context passed to an elevated process, are
 * written and read through this wrapper.
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <ranges>
#include <variant>

#include "../std/expected.hpp"
#include "../std/concept.hpp"
#include "../macro.hpp"


namespace ns_db
{

namespace fs = std::filesystem;

using json_t = nlohmann::json;

template<typename T>
concept IsString =
     std::convertible_to<std::decay_t<T>, std::string>
  or std::constructible_from<std::string, std::decay_t<T>>;

using KeyType = json_t::value_t;

/**
 * @class Db
 * @brief A type-safe wrapper around nlohmann::json
 *
 * The Db either owns its json data or references a nested entry of another Db, so
 * `db("host")("user")("uid") = 1000` writes into the root document. Reads go through value<V>(),
 * which reports type mismatches as errors instead of throwing.
 */
class Db
{
  private:
    std::variant<json_t, std::reference_wrapper<json_t>> m_json;
  public:
    // Constructors
    Db() noexcept;
    template<typename T> requires std::same_as<std::remove_cvref_t<T>, json_t>
    explicit Db(T&& json) noexcept;
    template<typename T> requires std::same_as<std::remove_cvref_t<T>, json_t>
    explicit Db(std::reference_wrapper<T> const& json) noexcept;
    // Element access
    [[nodiscard]] std::vector<std::string> keys() const noexcept;
    template<typename V = Db>
    [[nodiscard]] Value<V> value() noexcept;
    [[nodiscard]] Value<std::string> dump(int indent = -1) const;
    // Lookup
    template<IsString T>
    [[nodiscard]] bool contains(T&& t) const noexcept;
    [[nodiscard]] KeyType type() const noexcept;
    json_t& data();
    json_t const& data() const;
    // Operators
    template<typename T>
    Db& operator=(T&& t);
    [[nodiscard]] Db operator()(std::string const& t);
    // Friends
    friend std::ostream& operator<<(std::ostream& os, Db const& db);
};

/**
 * @brief Constructs a new Db object with an empty JSON object
 */
inline Db::Db() noexcept : m_json(json_t::object())
{
}

/**
 * @brief Constructs a new Db object that references an existing JSON entry
 */
template<typename T> requires std::same_as<std::remove_cvref_t<T>, json_t>
inline Db::Db(std::reference_wrapper<T> const& json) noexcept : m_json(json)
{
}

/**
 * @brief Constructs a new Db object that owns a copy of the JSON data
 */
template<typename T> requires std::same_as<std::remove_cvref_t<T>, json_t>
inline Db::Db(T&& json) noexcept : m_json(json)
{
}

/**
 * @brief Retrieves a mutable reference to the underlying JSON data
 */
inline json_t& Db::data()
{
  if (std::holds_alternative<std::reference_wrapper<json_t>>(m_json))
  {
    return std::get<std::reference_wrapper<json_t>>(m_json).get();
  }

  return std::get<json_t>(m_json);
}

inline json_t const& Db::data() const
{
  return const_cast<Db*>(this)->data();
}

/**
 * @brief Retrieves all keys of the current JSON object
 *
 * @return std::vector<std::string> The keys, or an empty vector if the entry is not structured
 */
inline std::vector<std::string> Db::keys() const noexcept
{
  json_t const& json = data();
  return_if(not json.is_structured(), {}, "E::Invalid non-structured json access");
  return json.items()
    | std::views::transform([&](auto&& e) { return e.key(); })
    | std::ranges::to<std::vector<std::string>>();
}

/**
 * @brief Converts the current JSON entry to a specified type
 *
 * Supports:
 * - Db: a wrapper for the current entry
 * - json_t: a copy of the current entry
 * - std::vector<std::string>: a JSON array of strings
 * - Integral types: a JSON integer
 * - String types: a JSON string
 *
 * @tparam V The target type to convert to (default: Db)
 * @return Value<V> The converted object on success, or error on type mismatch
 */
template<typename V>
Value<V> Db::value() noexcept
{
  json_t& json = data();
  if constexpr ( std::same_as<V,Db> )
  {
    return Db{std::reference_wrapper<json_t>(json)};
  }
  else if constexpr ( std::same_as<V,json_t> )
  {
    return json;
  }
  else if constexpr ( ns_concept::IsVector<V> and std::same_as<typename V::value_type, std::string>)
  {
    return_if(not json.is_array(), Error("D::Tried to create array with non-array entry"));
    return_if(std::any_of(json.begin(), json.end(), [](auto&& e){ return not e.is_string(); })
      , Error("D::Invalid key type for string array")
    );
    return std::ranges::subrange(json.begin(), json.end())
      | std::views::transform([](auto&& e){ return e.template get<std::string>(); })
      | std::ranges::to<V>();
  }
  else if constexpr ( std::integral<V> )
  {
    return ( json.is_number_integer() )?
        Value<V>(json.template get<V>())
      : Error("D::Json element is not an integer");
  }
  else if constexpr (ns_concept::StringConstructible<V>)
  {
    return ( json.is_string() )?
        Value<V>(json.template get<std::string>())
      : Error("D::Json element is not a string");
  }
  else
  {
    static_assert(std::is_same_v<V, V> == false, "Unsupported type V for value()");
    return Error("D::No viable type conversion");
  }
}

/**
 * @brief Serializes the current JSON data
 *
 * @param indent Indentation of nested entries, -1 for a single line
 * @return Value<std::string> The JSON text on success, or error on serialization failure
 */
inline Value<std::string> Db::dump(int indent) const
{
  return Try(data().dump(indent));
}

/**
 * @brief Checks if the JSON object contains a specific key
 */
template<IsString T>
bool Db::contains(T&& key) const noexcept
{
  json_t const& json = data();
  return json.is_object() && json.contains(key);
}

inline KeyType Db::type() const noexcept
{
  return data().type();
}

/**
 * @brief Assigns a new value to the underlying JSON data
 */
template<typename T>
Db& Db::operator=(T&& value)
{
  data() = value;
  return *this;
}

/**
 * @brief Accesses or creates a nested JSON entry by key
 *
 * @param key The key to access or create in the JSON object
 * @return Db A new Db with a reference to the nested element, or the current object when the
 * entry is not an object
 */
inline Db Db::operator()(std::string const& key)
{
  json_t& json = data();

  if(json.is_object() or json.empty())
  {
    return Db{std::reference_wrapper<json_t>(json[key])};
  }

  return *this;
}

inline std::ostream& operator<<(std::ostream& os, Db const& db)
{
  os << db.data();
  return os;
}

/**
 * @brief Parses a JSON string and creates a Db object
 *
 * @param s The JSON text
 * @return Value<Db> The parsed database object on success, or error on parse failure
 */
template<ns_concept::StringRepresentable S>
Value<Db> from_string(S&& s)
{
  std::string data = ns_string::to_string(s);
  return_if(data.empty(), Error("D::Empty json data"));
  return Try(Db{json_t::parse(data)}, "D::Could not parse json data");
}

} // namespace ns_db

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
