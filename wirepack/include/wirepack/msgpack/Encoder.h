#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Allocator.h"
#include "wirepack/Array.h"
#include "wirepack/Buffer.h"
#include "wirepack/Func.h"
#include "wirepack/Result.h"
#include "wirepack/String.h"
#include "wirepack/msgpack/Codec.h"
#include "wirepack/msgpack/Error.h"
#include "wirepack/msgpack/Scratch.h"
#include "wirepack/msgpack/Value.h"

#include <cstddef>
#include <cstdint>

namespace wirepack
{
	class Log;
}

namespace wirepack::msgpack
{
	struct EncoderConfig
	{
		enum FLOAT_PRECISION
		{
			FLOAT_PRECISION_32,
			FLOAT_PRECISION_64,
		};

		enum OBJECT_KEY
		{
			// ascii keys are copied verbatim, other keys fall back to the utf-8 path
			OBJECT_KEY_ASCII,
			OBJECT_KEY_UTF8,
		};

		FLOAT_PRECISION floatPrecision = FLOAT_PRECISION_64;
		OBJECT_KEY objectKey = OBJECT_KEY_ASCII;
		// property names of an object in encoding order, Object::keys when empty
		Func<void(const Object&, Array<String>&)> objectKeys;
		// whether an object is encoded as an array, Object::isSequence when empty
		Func<bool(const Object&)> isArray;
		// strings shorter than this are written straight into the output
		size_t stringInlineMax = 15;
		// binaries shorter than this are copied byte by byte
		size_t binaryInlineMax = 7;
		size_t scratchAllocMin = 2048;
		// substitutes a value for one that has no encodable shape, fails with KIND_ENCODING_FAILED when empty
		Func<Result<Value, Error>(const Value&)> unsupported;
		CodecRegistry* codecs = nullptr;
		size_t maxDepth = 512;
		Log* log = nullptr;
	};

	class Encoder
	{
		Allocator* m_allocator = nullptr;
		EncoderConfig m_config;
		Scratch m_scratch;
		size_t m_depth = 0;

		Error encodeValue(Buffer& out, const Value& value, bool allow_handler);
		Error encodeNumber(Buffer& out, const Value& value);
		Error encodeArray(Buffer& out, const Array<Value>& array);
		Error encodeMap(Buffer& out, const Map& map);
		Error encodeSequence(Buffer& out, const Object& object);
		Error encodeProperties(Buffer& out, const Object& object);
		Error encodeKey(Buffer& out, StringView key);
		Error encodeMapKey(Buffer& out, const Value& key);
		Result<bool, Error> encodeWithCodecs(Buffer& out, const Value& value);
		Error encodeUnsupported(Buffer& out, const Value& value, bool allow_handler);
		Error encodingFailed(const Value& value);

	public:
		WIREPACK_EXPORT Encoder(EncoderConfig config, Allocator* allocator);

		Encoder(const Encoder&) = delete;
		Encoder& operator=(const Encoder&) = delete;

		Allocator* allocator() const { return m_allocator; }
		const EncoderConfig& config() const { return m_config; }
		const Scratch& scratch() const { return m_scratch; }

		WIREPACK_EXPORT Result<Buffer, Error> encode(const Value& value);
		// appends the encoding of value to out, out is left untouched on failure
		WIREPACK_EXPORT Error encodeTo(Buffer& out, const Value& value);

		WIREPACK_EXPORT void write_nil(Buffer& out);
		WIREPACK_EXPORT void write_bool(Buffer& out, bool value);
		WIREPACK_EXPORT void write_int(Buffer& out, int64_t value);
		WIREPACK_EXPORT void write_uint(Buffer& out, uint64_t value);
		WIREPACK_EXPORT void write_float32(Buffer& out, float value);
		WIREPACK_EXPORT void write_float64(Buffer& out, double value);
		WIREPACK_EXPORT Error write_string(Buffer& out, StringView value);
		WIREPACK_EXPORT Error write_binary(Buffer& out, Span<const std::byte> value);
		WIREPACK_EXPORT Error write_array_header(Buffer& out, size_t count);
		WIREPACK_EXPORT Error write_map_header(Buffer& out, size_t count);
		WIREPACK_EXPORT Error write_ext(Buffer& out, int8_t type, Span<const std::byte> payload);
	};
}
