#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Allocator.h"
#include "wirepack/Result.h"
#include "wirepack/Span.h"
#include "wirepack/msgpack/Codec.h"
#include "wirepack/msgpack/Error.h"
#include "wirepack/msgpack/Value.h"

#include <cstddef>

namespace wirepack
{
	class Log;
}

namespace wirepack::msgpack
{
	struct DecoderConfig
	{
		enum INTEGER_MODE
		{
			// integers that fit int64_t decode as KIND_INT, larger ones as KIND_UINT
			INTEGER_MODE_INT64,
			// integers within +-(2^53 - 1) decode as KIND_DOUBLE, the rest keep a 64-bit integer kind
			INTEGER_MODE_SAFE_DOUBLE,
		};

		enum MAP_KEYS
		{
			MAP_KEYS_VALUE,
			// scalar keys are converted to their text form, container keys are rejected
			MAP_KEYS_STRING,
		};

		INTEGER_MODE integerMode = INTEGER_MODE_INT64;
		MAP_KEYS mapKeys = MAP_KEYS_VALUE;
		CodecRegistry* codecs = nullptr;
		size_t maxDepth = 512;
		bool allowTrailingBytes = false;
		Log* log = nullptr;
	};

	class Decoder
	{
		struct Cursor;

		Allocator* m_allocator = nullptr;
		DecoderConfig m_config;

		Result<Value, Error> decodeValue(Cursor& cursor, size_t depth);
		Result<Value, Error> decodeArray(Cursor& cursor, size_t count, size_t depth);
		Result<Value, Error> decodeMap(Cursor& cursor, size_t count, size_t depth);
		Result<Value, Error> decodeExt(Cursor& cursor, size_t count);
		Result<Value, Error> mapKeyToString(Value key);
		Value integer(int64_t value) const;
		Value integer(uint64_t value) const;

	public:
		WIREPACK_EXPORT Decoder(DecoderConfig config, Allocator* allocator);

		Allocator* allocator() const { return m_allocator; }
		const DecoderConfig& config() const { return m_config; }

		// decodes exactly one value from bytes, trailing bytes fail with KIND_INVALID_FORMAT unless allowed
		WIREPACK_EXPORT Result<Value, Error> decode(Span<const std::byte> bytes);
		// decodes the first value in bytes and reports how many bytes it took
		WIREPACK_EXPORT Result<Value, Error> decodePrefix(Span<const std::byte> bytes, size_t& consumed);
	};
}
