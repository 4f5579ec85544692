#pragma once

#include "aidb/blocks/schema.hpp"

#include <array>
#include <variant>
#include <vector>

// value tags as stored in front of every column
enum ValueTag : u8
{
  TagNull = 0,
  TagInteger = 1,
  TagReal = 2,
  TagText = 3,
};

// text up to this many bytes sits in the row itself
const std::size_t INLINE_TEXT_MAX = 8;

const std::size_t ROW_HEADER_SIZE = 1;
const std::size_t TAG_SIZE = 1;
const std::size_t NUMBER_SIZE = 8;
// u64 length followed by an 8 byte slot holding the bytes or a text block index
const std::size_t TEXT_SIZE = 16;

// the 8 byte slot after a text length
struct InlineText
{
  std::array<char, INLINE_TEXT_MAX> bytes = {0};
};

struct IndirectText
{
  BlockIndex start;
};

using TextSlot = std::variant<InlineText, IndirectText>;

// a stored overflow string, as found in an encoded row
struct TextRef
{
  BlockIndex start;
  u64 length;

  friend bool operator==(const TextRef &, const TextRef &) = default;
};

// marks a tombstoned row when decoding
struct Deleted
{
  friend bool operator==(const Deleted &, const Deleted &) = default;
};

using DecodedRow = std::variant<Row, Deleted>;

/* one row is
 *   i8 column count, <= 0 for a tombstone
 *   then per column a u8 tag and its payload:
 *     null    nothing
 *     integer 8 byte two's complement
 *     real    8 byte IEEE-754
 *     text    u64 length, then the bytes zero padded to 8 if they fit, else the first text block
 * a tombstone keeps its payload, the count is negated so the row can still be stepped over */
class RowCodec
{
public:
  // checks the row against the table and writes out any long text
  static std::vector<std::byte> encode(const Row &row, const TableDef &table, TextChains &texts);
  static DecodedRow decode(ConstBytes bytes, const TableDef &table, TextChains &texts,
                           BlockIndex block = NULL_BLOCK, std::size_t offset = 0);

  // size the row will take once encoded, after checking it against the table
  static std::size_t sizeOf(const Row &row, const TableDef &table);
  // size of an encoded row starting at the front of bytes, tombstone or not
  static std::size_t encodedSize(ConstBytes bytes, BlockIndex block = NULL_BLOCK, std::size_t offset = 0);

  static bool isTombstone(ConstBytes bytes) noexcept;
  static void tombstone(Bytes bytes);

  // the overflow text chains an encoded row points to
  static std::vector<TextRef> textRefs(ConstBytes bytes, BlockIndex block = NULL_BLOCK, std::size_t offset = 0);

  static TextSlot textSlot(std::string_view text, TextChains &texts);
};
