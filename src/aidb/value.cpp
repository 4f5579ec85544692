#include "aidb/value.hpp"

#include <algorithm>
#include <cctype>

const char *dataTypeName(DataType type) noexcept
{
  switch (type)
  {
  case DataType::Integer:
    return "INTEGER";
  case DataType::Real:
    return "REAL";
  case DataType::Text:
    return "TEXT";
  }
  return "UNKNOWN";
}

std::optional<DataType> parseDataType(std::string_view name) noexcept
{
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "INTEGER" || upper == "INT")
    return DataType::Integer;
  if (upper == "REAL" || upper == "DOUBLE" || upper == "FLOAT")
    return DataType::Real;
  if (upper == "TEXT" || upper == "VARCHAR")
    return DataType::Text;
  return std::nullopt;
}

std::optional<DataType> valueType(const Value &v) noexcept
{
  switch (v.index())
  {
  case 1:
    return DataType::Integer;
  case 2:
    return DataType::Real;
  case 3:
    return DataType::Text;
  default:
    return std::nullopt;
  }
}

std::ostream &operator<<(std::ostream &os, const Value &v)
{
  if (const i64 *i = std::get_if<i64>(&v); i != nullptr)
  {
    os << *i;
  }
  else if (const double *d = std::get_if<double>(&v); d != nullptr)
  {
    os << *d;
  }
  else if (const std::string *s = std::get_if<std::string>(&v); s != nullptr)
  {
    os << '"' << *s << '"';
  }
  else
  {
    os << "NULL";
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const Row &row)
{
  os << "(";
  for (std::size_t i = 0; i < row.size(); i++)
  {
    if (i > 0)
      os << ", ";
    os << row[i];
  }
  return os << ")";
}

std::ostream &operator<<(std::ostream &os, const RowPointer &p)
{
  return os << p.block << ":" << p.offset;
}
