#pragma once

#include "aidb/errors.hpp"

#include <compare>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

// column types, the numbers are the on-disk tags
enum class DataType : u8
{
  Integer = 1,
  Real = 2,
  Text = 3,
};

const char *dataTypeName(DataType type) noexcept;
std::optional<DataType> parseDataType(std::string_view name) noexcept;

// null, integer, real or text
using Value = std::variant<std::monostate, i64, double, std::string>;
using Row = std::vector<Value>;

// the type of a value, or empty for null
std::optional<DataType> valueType(const Value &v) noexcept;

std::ostream &operator<<(std::ostream &os, const Value &v);
std::ostream &operator<<(std::ostream &os, const Row &row);

// where a row lives: the data block and the byte offset of the row inside it
struct RowPointer
{
  BlockIndex block = 0;
  u16 offset = 0;

  friend bool operator==(const RowPointer &, const RowPointer &) = default;
  friend auto operator<=>(const RowPointer &, const RowPointer &) = default;
};

std::ostream &operator<<(std::ostream &os, const RowPointer &p);
