#pragma once

#include "wirepack/Exports.h"
#include "wirepack/StringView.h"

#include <cstddef>
#include <cstdint>

namespace wirepack::msgpack
{
	enum TAG : uint8_t
	{
		TAG_POSITIVE_FIXINT = 0x00,
		TAG_POSITIVE_FIXINT_MAX = 0x7f,
		TAG_FIXMAP = 0x80,
		TAG_FIXARRAY = 0x90,
		TAG_FIXSTR = 0xa0,
		TAG_NIL = 0xc0,
		TAG_NEVER_USED = 0xc1,
		TAG_FALSE = 0xc2,
		TAG_TRUE = 0xc3,
		TAG_BIN8 = 0xc4,
		TAG_BIN16 = 0xc5,
		TAG_BIN32 = 0xc6,
		TAG_EXT8 = 0xc7,
		TAG_EXT16 = 0xc8,
		TAG_EXT32 = 0xc9,
		TAG_FLOAT32 = 0xca,
		TAG_FLOAT64 = 0xcb,
		TAG_UINT8 = 0xcc,
		TAG_UINT16 = 0xcd,
		TAG_UINT32 = 0xce,
		TAG_UINT64 = 0xcf,
		TAG_INT8 = 0xd0,
		TAG_INT16 = 0xd1,
		TAG_INT32 = 0xd2,
		TAG_INT64 = 0xd3,
		TAG_FIXEXT1 = 0xd4,
		TAG_FIXEXT2 = 0xd5,
		TAG_FIXEXT4 = 0xd6,
		TAG_FIXEXT8 = 0xd7,
		TAG_FIXEXT16 = 0xd8,
		TAG_STR8 = 0xd9,
		TAG_STR16 = 0xda,
		TAG_STR32 = 0xdb,
		TAG_ARRAY16 = 0xdc,
		TAG_ARRAY32 = 0xdd,
		TAG_MAP16 = 0xde,
		TAG_MAP32 = 0xdf,
		TAG_NEGATIVE_FIXINT = 0xe0,
	};

	// largest count or length embedded in the low bits of a fix tag
	constexpr size_t FIXMAP_MAX = 15;
	constexpr size_t FIXARRAY_MAX = 15;
	constexpr size_t FIXSTR_MAX = 31;

	enum FORMAT : uint8_t
	{
		FORMAT_POSITIVE_FIXINT,
		FORMAT_FIXMAP,
		FORMAT_FIXARRAY,
		FORMAT_FIXSTR,
		FORMAT_NIL,
		FORMAT_NEVER_USED,
		FORMAT_FALSE,
		FORMAT_TRUE,
		FORMAT_BIN8,
		FORMAT_BIN16,
		FORMAT_BIN32,
		FORMAT_EXT8,
		FORMAT_EXT16,
		FORMAT_EXT32,
		FORMAT_FLOAT32,
		FORMAT_FLOAT64,
		FORMAT_UINT8,
		FORMAT_UINT16,
		FORMAT_UINT32,
		FORMAT_UINT64,
		FORMAT_INT8,
		FORMAT_INT16,
		FORMAT_INT32,
		FORMAT_INT64,
		FORMAT_FIXEXT1,
		FORMAT_FIXEXT2,
		FORMAT_FIXEXT4,
		FORMAT_FIXEXT8,
		FORMAT_FIXEXT16,
		FORMAT_STR8,
		FORMAT_STR16,
		FORMAT_STR32,
		FORMAT_ARRAY16,
		FORMAT_ARRAY32,
		FORMAT_MAP16,
		FORMAT_MAP32,
		FORMAT_NEGATIVE_FIXINT,
	};

	struct FormatTable
	{
		FORMAT entries[256];

		constexpr FORMAT operator[](uint8_t tag) const { return entries[tag]; }
	};

	constexpr FormatTable makeFormatTable()
	{
		FormatTable table{};

		for (int i = 0x00; i <= 0x7f; ++i)
			table.entries[i] = FORMAT_POSITIVE_FIXINT;
		for (int i = 0x80; i <= 0x8f; ++i)
			table.entries[i] = FORMAT_FIXMAP;
		for (int i = 0x90; i <= 0x9f; ++i)
			table.entries[i] = FORMAT_FIXARRAY;
		for (int i = 0xa0; i <= 0xbf; ++i)
			table.entries[i] = FORMAT_FIXSTR;

		// 0xc0 to 0xdf map one to one onto the formats in tag order
		for (int i = TAG_NIL; i <= TAG_MAP32; ++i)
			table.entries[i] = FORMAT(FORMAT_NIL + (i - TAG_NIL));

		for (int i = 0xe0; i <= 0xff; ++i)
			table.entries[i] = FORMAT_NEGATIVE_FIXINT;

		return table;
	}

	inline constexpr FormatTable FORMAT_TABLE = makeFormatTable();

	static_assert(FORMAT_TABLE[TAG_NIL] == FORMAT_NIL);
	static_assert(FORMAT_TABLE[TAG_NEVER_USED] == FORMAT_NEVER_USED);
	static_assert(FORMAT_TABLE[TAG_FLOAT64] == FORMAT_FLOAT64);
	static_assert(FORMAT_TABLE[TAG_FIXEXT16] == FORMAT_FIXEXT16);
	static_assert(FORMAT_TABLE[TAG_MAP32] == FORMAT_MAP32);

	// fixext tag for payloads of exactly 1, 2, 4, 8 or 16 bytes, 0 for every other size
	constexpr uint8_t fixextTag(size_t size)
	{
		switch (size)
		{
		case 1: return TAG_FIXEXT1;
		case 2: return TAG_FIXEXT2;
		case 4: return TAG_FIXEXT4;
		case 8: return TAG_FIXEXT8;
		case 16: return TAG_FIXEXT16;
		default: return 0;
		}
	}

	WIREPACK_EXPORT StringView formatName(FORMAT format);
}
