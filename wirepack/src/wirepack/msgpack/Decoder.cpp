#include "wirepack/msgpack/Decoder.h"
#include "wirepack/msgpack/Format.h"
#include "wirepack/Intrinsics.h"
#include "wirepack/Log.h"

#include <tracy/Tracy.hpp>

#include <cstring>

namespace wirepack::msgpack
{
	constexpr int64_t MAX_SAFE_INTEGER = (int64_t(1) << 53) - 1;

	struct Decoder::Cursor
	{
		Span<const std::byte> bytes;
		size_t position = 0;
		Allocator* allocator = nullptr;

		size_t remaining() const { return bytes.count() - position; }

		Error require(size_t count, StringView what) const
		{
			if (count > remaining())
			{
				return errf(
					allocator,
					Error::KIND_TRUNCATED_INPUT,
					"{} needs {} bytes at offset {} but only {} remain"_sv,
					what,
					count,
					position,
					remaining()
				);
			}
			return {};
		}

		Error read_bytes(size_t count, StringView what, Span<const std::byte>& value)
		{
			if (auto err = require(count, what))
				return err;
			value = bytes.slice(position, position + count);
			position += count;
			return {};
		}

		Error read_uint8(uint8_t& value, StringView what)
		{
			if (auto err = require(sizeof(value), what))
				return err;
			value = uint8_t(bytes[position]);
			position += sizeof(value);
			return {};
		}

		Error read_uint16(uint16_t& value, StringView what)
		{
			if (auto err = require(sizeof(value), what))
				return err;
			::memcpy(&value, bytes.data() + position, sizeof(value));
			if (systemEndianness() == Endianness::Little)
				value = byteswap_uint16(value);
			position += sizeof(value);
			return {};
		}

		Error read_uint32(uint32_t& value, StringView what)
		{
			if (auto err = require(sizeof(value), what))
				return err;
			::memcpy(&value, bytes.data() + position, sizeof(value));
			if (systemEndianness() == Endianness::Little)
				value = byteswap_uint32(value);
			position += sizeof(value);
			return {};
		}

		Error read_uint64(uint64_t& value, StringView what)
		{
			if (auto err = require(sizeof(value), what))
				return err;
			::memcpy(&value, bytes.data() + position, sizeof(value));
			if (systemEndianness() == Endianness::Little)
				value = byteswap_uint64(value);
			position += sizeof(value);
			return {};
		}

		// reads a length prefix of 1, 2 or 4 bytes
		Error read_length(size_t width, size_t& value, StringView what)
		{
			switch (width)
			{
			case 1:
			{
				uint8_t v = 0;
				if (auto err = read_uint8(v, what))
					return err;
				value = v;
				return {};
			}
			case 2:
			{
				uint16_t v = 0;
				if (auto err = read_uint16(v, what))
					return err;
				value = v;
				return {};
			}
			case 4:
			{
				uint32_t v = 0;
				if (auto err = read_uint32(v, what))
					return err;
				value = v;
				return {};
			}
			default:
				unreachable();
				return {};
			}
		}
	};

	Decoder::Decoder(DecoderConfig config, Allocator* allocator)
		: m_allocator(allocator),
		  m_config(config)
	{}

	Result<Value, Error> Decoder::decode(Span<const std::byte> bytes)
	{
		size_t consumed = 0;
		auto res = decodePrefix(bytes, consumed);
		if (res.isError())
			return res;

		if (m_config.allowTrailingBytes == false && consumed != bytes.count())
		{
			return errf(
				m_allocator,
				Error::KIND_INVALID_FORMAT,
				"{} trailing bytes after a complete value of {} bytes"_sv,
				bytes.count() - consumed,
				consumed
			);
		}
		return res;
	}

	Result<Value, Error> Decoder::decodePrefix(Span<const std::byte> bytes, size_t& consumed)
	{
		ZoneScoped;

		Cursor cursor{bytes, 0, m_allocator};
		auto res = decodeValue(cursor, 0);
		consumed = cursor.position;
		return res;
	}

	Value Decoder::integer(int64_t value) const
	{
		if (m_config.integerMode == DecoderConfig::INTEGER_MODE_SAFE_DOUBLE &&
			value >= -MAX_SAFE_INTEGER && value <= MAX_SAFE_INTEGER)
		{
			return Value{double(value)};
		}
		return Value{value};
	}

	Value Decoder::integer(uint64_t value) const
	{
		if (value <= uint64_t(INT64_MAX))
			return integer(int64_t(value));
		return Value{value};
	}

	Result<Value, Error> Decoder::decodeValue(Cursor& cursor, size_t depth)
	{
		if (depth >= m_config.maxDepth)
			return errf(m_allocator, Error::KIND_INVALID_FORMAT, "input nesting exceeds the maximum depth of {}"_sv, m_config.maxDepth);

		uint8_t tag = 0;
		if (auto err = cursor.read_uint8(tag, "tag byte"_sv))
			return err;

		auto format = FORMAT_TABLE[tag];
		switch (format)
		{
		case FORMAT_POSITIVE_FIXINT:
			return integer(int64_t(tag));
		case FORMAT_NEGATIVE_FIXINT:
			return integer(int64_t(int8_t(tag)));
		case FORMAT_FIXMAP:
			return decodeMap(cursor, tag & 0x0f, depth);
		case FORMAT_FIXARRAY:
			return decodeArray(cursor, tag & 0x0f, depth);
		case FORMAT_NIL:
			return Value{};
		case FORMAT_NEVER_USED:
			return errf(m_allocator, Error::KIND_INVALID_FORMAT, "tag 0x{:02x} at offset {} is never used"_sv, tag, cursor.position - 1);
		case FORMAT_FALSE:
			return Value{false};
		case FORMAT_TRUE:
			return Value{true};
		case FORMAT_FIXSTR:
		case FORMAT_STR8:
		case FORMAT_STR16:
		case FORMAT_STR32:
		{
			size_t count = tag & 0x1f;
			if (format == FORMAT_STR8 || format == FORMAT_STR16 || format == FORMAT_STR32)
			{
				size_t width = format == FORMAT_STR8 ? 1 : (format == FORMAT_STR16 ? 2 : 4);
				if (auto err = cursor.read_length(width, count, formatName(format)))
					return err;
			}

			Span<const std::byte> payload;
			if (auto err = cursor.read_bytes(count, formatName(format), payload))
				return err;
			return Value{String{StringView{payload}, m_allocator}};
		}
		case FORMAT_BIN8:
		case FORMAT_BIN16:
		case FORMAT_BIN32:
		{
			size_t width = format == FORMAT_BIN8 ? 1 : (format == FORMAT_BIN16 ? 2 : 4);
			size_t count = 0;
			if (auto err = cursor.read_length(width, count, formatName(format)))
				return err;

			Span<const std::byte> payload;
			if (auto err = cursor.read_bytes(count, formatName(format), payload))
				return err;
			return Value{Buffer{payload, m_allocator}};
		}
		case FORMAT_EXT8:
		case FORMAT_EXT16:
		case FORMAT_EXT32:
		{
			size_t width = format == FORMAT_EXT8 ? 1 : (format == FORMAT_EXT16 ? 2 : 4);
			size_t count = 0;
			if (auto err = cursor.read_length(width, count, formatName(format)))
				return err;
			return decodeExt(cursor, count);
		}
		case FORMAT_FIXEXT1:
			return decodeExt(cursor, 1);
		case FORMAT_FIXEXT2:
			return decodeExt(cursor, 2);
		case FORMAT_FIXEXT4:
			return decodeExt(cursor, 4);
		case FORMAT_FIXEXT8:
			return decodeExt(cursor, 8);
		case FORMAT_FIXEXT16:
			return decodeExt(cursor, 16);
		case FORMAT_FLOAT32:
		{
			uint32_t bits = 0;
			if (auto err = cursor.read_uint32(bits, formatName(format)))
				return err;
			float value = 0;
			::memcpy(&value, &bits, sizeof(value));
			return Value{value};
		}
		case FORMAT_FLOAT64:
		{
			uint64_t bits = 0;
			if (auto err = cursor.read_uint64(bits, formatName(format)))
				return err;
			double value = 0;
			::memcpy(&value, &bits, sizeof(value));
			return Value{value};
		}
		case FORMAT_UINT8:
		{
			uint8_t value = 0;
			if (auto err = cursor.read_uint8(value, formatName(format)))
				return err;
			return integer(uint64_t(value));
		}
		case FORMAT_UINT16:
		{
			uint16_t value = 0;
			if (auto err = cursor.read_uint16(value, formatName(format)))
				return err;
			return integer(uint64_t(value));
		}
		case FORMAT_UINT32:
		{
			uint32_t value = 0;
			if (auto err = cursor.read_uint32(value, formatName(format)))
				return err;
			return integer(uint64_t(value));
		}
		case FORMAT_UINT64:
		{
			uint64_t value = 0;
			if (auto err = cursor.read_uint64(value, formatName(format)))
				return err;
			return integer(value);
		}
		case FORMAT_INT8:
		{
			uint8_t value = 0;
			if (auto err = cursor.read_uint8(value, formatName(format)))
				return err;
			return integer(int64_t(int8_t(value)));
		}
		case FORMAT_INT16:
		{
			uint16_t value = 0;
			if (auto err = cursor.read_uint16(value, formatName(format)))
				return err;
			return integer(int64_t(int16_t(value)));
		}
		case FORMAT_INT32:
		{
			uint32_t value = 0;
			if (auto err = cursor.read_uint32(value, formatName(format)))
				return err;
			return integer(int64_t(int32_t(value)));
		}
		case FORMAT_INT64:
		{
			uint64_t value = 0;
			if (auto err = cursor.read_uint64(value, formatName(format)))
				return err;
			return integer(int64_t(value));
		}
		case FORMAT_ARRAY16:
		case FORMAT_ARRAY32:
		{
			size_t count = 0;
			if (auto err = cursor.read_length(format == FORMAT_ARRAY16 ? 2 : 4, count, formatName(format)))
				return err;
			return decodeArray(cursor, count, depth);
		}
		case FORMAT_MAP16:
		case FORMAT_MAP32:
		{
			size_t count = 0;
			if (auto err = cursor.read_length(format == FORMAT_MAP16 ? 2 : 4, count, formatName(format)))
				return err;
			return decodeMap(cursor, count, depth);
		}
		default:
			unreachable();
			return errf(m_allocator, Error::KIND_INVALID_FORMAT, "unknown tag 0x{:02x}"_sv, tag);
		}
	}

	Result<Value, Error> Decoder::decodeArray(Cursor& cursor, size_t count, size_t depth)
	{
		// every element takes at least one byte, so a count beyond the remaining input can never be satisfied
		if (auto err = cursor.require(count, "array elements"_sv))
			return err;

		Array<Value> array{m_allocator};
		array.reserve(count);
		for (size_t i = 0; i < count; ++i)
		{
			auto element = decodeValue(cursor, depth + 1);
			if (element.isError())
				return element.releaseError();
			array.push(element.releaseValue());
		}
		return Value{std::move(array)};
	}

	Result<Value, Error> Decoder::decodeMap(Cursor& cursor, size_t count, size_t depth)
	{
		if (auto err = cursor.require(count * 2, "map entries"_sv))
			return err;

		Map map{m_allocator};
		map.reserve(count);
		for (size_t i = 0; i < count; ++i)
		{
			auto key = decodeValue(cursor, depth + 1);
			if (key.isError())
				return key.releaseError();

			if (m_config.mapKeys == DecoderConfig::MAP_KEYS_STRING)
			{
				key = mapKeyToString(key.releaseValue());
				if (key.isError())
					return key.releaseError();
			}

			auto value = decodeValue(cursor, depth + 1);
			if (value.isError())
				return value.releaseError();

			auto is_new = map.insert(key.releaseValue(), value.releaseValue());
			if (is_new == false && m_config.log)
				m_config.log->debug("duplicate map key at offset {}, the later value wins"_sv, cursor.position);
		}
		return Value{std::move(map)};
	}

	Result<Value, Error> Decoder::decodeExt(Cursor& cursor, size_t count)
	{
		uint8_t type_byte = 0;
		if (auto err = cursor.read_uint8(type_byte, "ext type"_sv))
			return err;

		Span<const std::byte> payload;
		if (auto err = cursor.read_bytes(count, "ext payload"_sv, payload))
			return err;

		auto type = int8_t(type_byte);
		if (m_config.codecs && type >= 0)
		{
			if (auto codec = m_config.codecs->findByType(type))
			{
				auto res = codec->decode(payload, m_allocator);
				if (res.isEmpty() == false)
					return res;
			}
		}

		if (m_config.log)
			m_config.log->debug("no codec for ext type {}, keeping the raw {} byte payload"_sv, type, count);
		return Value{Ext{type, payload, m_allocator}};
	}

	Result<Value, Error> Decoder::mapKeyToString(Value key)
	{
		switch (key.kind())
		{
		case Value::KIND_STRING:
			return key;
		case Value::KIND_NIL:
			return Value::string("null"_sv, m_allocator);
		case Value::KIND_BOOL:
			return Value::string(key.as_bool() ? "true"_sv : "false"_sv, m_allocator);
		case Value::KIND_INT:
			return Value{strf(m_allocator, "{}"_sv, key.as_int())};
		case Value::KIND_UINT:
			return Value{strf(m_allocator, "{}"_sv, key.as_uint())};
		case Value::KIND_FLOAT:
			return Value{strf(m_allocator, "{}"_sv, key.as_float())};
		case Value::KIND_DOUBLE:
			return Value{strf(m_allocator, "{}"_sv, key.as_double())};
		default:
			return errf(
				m_allocator,
				Error::KIND_INVALID_FORMAT,
				"map key of kind {} has no string form"_sv,
				kindName(key.kind())
			);
		}
	}
}
