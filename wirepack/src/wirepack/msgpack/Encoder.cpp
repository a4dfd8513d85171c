#include "wirepack/msgpack/Encoder.h"
#include "wirepack/msgpack/Format.h"
#include "wirepack/Intrinsics.h"
#include "wirepack/Rune.h"
#include "wirepack/Log.h"

#include <tracy/Tracy.hpp>

#include <cmath>
#include <cstring>

namespace wirepack::msgpack
{
	constexpr double TWO_POW_63 = 9223372036854775808.0;
	constexpr double TWO_POW_64 = 18446744073709551616.0;

	inline static void pushBigEndian16(Buffer& out, uint16_t value)
	{
		if (systemEndianness() == Endianness::Little)
			value = byteswap_uint16(value);
		out.push((const std::byte*)&value, sizeof(value));
	}

	inline static void pushBigEndian32(Buffer& out, uint32_t value)
	{
		if (systemEndianness() == Endianness::Little)
			value = byteswap_uint32(value);
		out.push((const std::byte*)&value, sizeof(value));
	}

	inline static void pushBigEndian64(Buffer& out, uint64_t value)
	{
		if (systemEndianness() == Endianness::Little)
			value = byteswap_uint64(value);
		out.push((const std::byte*)&value, sizeof(value));
	}

	inline static Error writeStringHeader(Allocator* allocator, Buffer& out, size_t count)
	{
		if (count <= FIXSTR_MAX)
		{
			out.push(uint8_t(TAG_FIXSTR | count));
		}
		else if (count <= UINT8_MAX)
		{
			out.push(uint8_t(TAG_STR8));
			out.push(uint8_t(count));
		}
		else if (count <= UINT16_MAX)
		{
			out.push(uint8_t(TAG_STR16));
			pushBigEndian16(out, uint16_t(count));
		}
		else if (count <= UINT32_MAX)
		{
			out.push(uint8_t(TAG_STR32));
			pushBigEndian32(out, uint32_t(count));
		}
		else
		{
			return errf(allocator, Error::KIND_ENCODING_FAILED, "string of {} bytes exceeds the str32 limit"_sv, count);
		}
		return {};
	}

	// tracks container nesting for the lifetime of one encodeValue call
	struct DepthScope
	{
		size_t& depth;

		explicit DepthScope(size_t& d)
			: depth(d)
		{
			++depth;
		}

		~DepthScope()
		{
			--depth;
		}
	};

	Encoder::Encoder(EncoderConfig config, Allocator* allocator)
		: m_allocator(allocator),
		  m_config(std::move(config)),
		  m_scratch(m_config.scratchAllocMin, allocator, m_config.log)
	{}

	Result<Buffer, Error> Encoder::encode(const Value& value)
	{
		Buffer out{m_allocator};
		if (auto err = encodeTo(out, value))
			return err;
		return out;
	}

	Error Encoder::encodeTo(Buffer& out, const Value& value)
	{
		ZoneScoped;

		auto mark = out.count();
		if (auto err = encodeValue(out, value, true))
		{
			out.resize(mark);
			return err;
		}
		return {};
	}

	Error Encoder::encodeValue(Buffer& out, const Value& value, bool allow_handler)
	{
		if (m_depth >= m_config.maxDepth)
			return errf(m_allocator, Error::KIND_ENCODING_FAILED, "value nesting exceeds the maximum depth of {}"_sv, m_config.maxDepth);

		DepthScope scope{m_depth};

		switch (value.kind())
		{
		case Value::KIND_STRING:
			return write_string(out, value.as_string());
		case Value::KIND_INT:
		case Value::KIND_UINT:
		case Value::KIND_FLOAT:
		case Value::KIND_DOUBLE:
			return encodeNumber(out, value);
		case Value::KIND_NIL:
			write_nil(out);
			return {};
		case Value::KIND_BOOL:
			write_bool(out, value.as_bool());
			return {};
		case Value::KIND_BYTES:
			return write_binary(out, value.as_bytes());
		case Value::KIND_ARRAY:
			return encodeArray(out, value.as_array());
		case Value::KIND_EXT:
			return write_ext(out, value.as_ext().type(), value.as_ext().bytes());
		case Value::KIND_MAP:
		{
			auto claimed = encodeWithCodecs(out, value);
			if (claimed.isError())
				return claimed.releaseError();
			if (claimed.value())
				return {};
			return encodeMap(out, value.as_map());
		}
		case Value::KIND_OBJECT:
		{
			const auto& object = *value.as_object();

			bool is_array = m_config.isArray ? m_config.isArray(object) : object.isSequence();
			if (is_array)
				return encodeSequence(out, object);

			auto claimed = encodeWithCodecs(out, value);
			if (claimed.isError())
				return claimed.releaseError();
			if (claimed.value())
				return {};

			if (object.isCallable())
				return encodeUnsupported(out, value, allow_handler);

			return encodeProperties(out, object);
		}
		default:
			unreachable();
			return encodingFailed(value);
		}
	}

	Error Encoder::encodeNumber(Buffer& out, const Value& value)
	{
		// doubles without a fractional part that are exact in 64 bits take the integer ladder
		auto write_integral = [this, &out](double d) {
			if (std::isfinite(d) == false || std::trunc(d) != d)
				return false;

			if (d >= -TWO_POW_63 && d < TWO_POW_63)
			{
				write_int(out, int64_t(d));
				return true;
			}
			else if (d >= 0 && d < TWO_POW_64)
			{
				write_uint(out, uint64_t(d));
				return true;
			}
			return false;
		};

		switch (value.kind())
		{
		case Value::KIND_INT:
			write_int(out, value.as_int());
			break;
		case Value::KIND_UINT:
			write_uint(out, value.as_uint());
			break;
		case Value::KIND_FLOAT:
			if (write_integral(double(value.as_float())) == false)
				write_float32(out, value.as_float());
			break;
		case Value::KIND_DOUBLE:
			if (write_integral(value.as_double()))
				break;
			if (m_config.floatPrecision == EncoderConfig::FLOAT_PRECISION_32)
				write_float32(out, float(value.as_double()));
			else
				write_float64(out, value.as_double());
			break;
		default:
			unreachable();
			break;
		}
		return {};
	}

	Error Encoder::encodeArray(Buffer& out, const Array<Value>& array)
	{
		if (auto err = write_array_header(out, array.count()))
			return err;

		for (const auto& element: array)
			if (auto err = encodeValue(out, element, true))
				return err;
		return {};
	}

	Error Encoder::encodeMap(Buffer& out, const Map& map)
	{
		if (auto err = write_map_header(out, map.count()))
			return err;

		for (const auto& entry: map)
		{
			if (auto err = encodeMapKey(out, entry.key))
				return err;
			if (auto err = encodeValue(out, entry.value, true))
				return err;
		}
		return {};
	}

	Error Encoder::encodeSequence(Buffer& out, const Object& object)
	{
		auto count = object.count();
		if (auto err = write_array_header(out, count))
			return err;

		for (size_t i = 0; i < count; ++i)
		{
			auto element = object.element(i, m_allocator);
			if (auto err = encodeValue(out, element, true))
				return err;
		}
		return {};
	}

	Error Encoder::encodeProperties(Buffer& out, const Object& object)
	{
		Array<String> keys{m_allocator};
		if (m_config.objectKeys)
			m_config.objectKeys(object, keys);
		else
			object.keys(keys);

		if (auto err = write_map_header(out, keys.count()))
			return err;

		for (const auto& key: keys)
		{
			if (auto err = encodeKey(out, key))
				return err;

			auto property = object.property(key, m_allocator);
			if (auto err = encodeValue(out, property, true))
				return err;
		}
		return {};
	}

	Error Encoder::encodeKey(Buffer& out, StringView key)
	{
		if (m_config.objectKey == EncoderConfig::OBJECT_KEY_ASCII && key.isAscii())
		{
			if (auto err = writeStringHeader(m_allocator, out, key.count()))
				return err;
			out.push(key);
			return {};
		}
		return write_string(out, key);
	}

	Error Encoder::encodeMapKey(Buffer& out, const Value& key)
	{
		if (key.kind() == Value::KIND_STRING)
			return encodeKey(out, key.as_string());
		return encodeValue(out, key, true);
	}

	Result<bool, Error> Encoder::encodeWithCodecs(Buffer& out, const Value& value)
	{
		if (m_config.codecs == nullptr)
			return false;

		auto& codecs = *m_config.codecs;
		for (size_t i = codecs.count(); i > 0; --i)
		{
			auto codec = codecs[i - 1];
			if (codec->supports(value) == false)
				continue;

			auto payload = codec->encode(*this, value);
			if (payload.isError())
				return payload.releaseError();
			if (payload.isEmpty())
				continue;

			if (m_config.log)
				m_config.log->trace("codec for ext type {} claimed a {} value"_sv, codec->type(), kindName(value.kind()));

			if (auto err = write_ext(out, codec->type(), payload.value()))
				return err;
			return true;
		}
		return false;
	}

	Error Encoder::encodeUnsupported(Buffer& out, const Value& value, bool allow_handler)
	{
		if (m_config.log)
			m_config.log->warn("no encodable representation for {} ({})"_sv, value, kindName(value.kind()));

		if (allow_handler == false || !m_config.unsupported)
			return encodingFailed(value);

		auto replacement = m_config.unsupported(value);
		if (replacement.isError())
			return replacement.releaseError();
		if (replacement.isEmpty())
			return encodingFailed(value);

		// the substitute must be encodable on its own, it never reaches the handler again
		return encodeValue(out, replacement.value(), false);
	}

	Error Encoder::encodingFailed(const Value& value)
	{
		auto message = strf(m_allocator, "could not encode: {} ({})"_sv, value, kindName(value.kind()));
		return Error{std::move(message), value};
	}

	void Encoder::write_nil(Buffer& out)
	{
		out.push(uint8_t(TAG_NIL));
	}

	void Encoder::write_bool(Buffer& out, bool value)
	{
		out.push(uint8_t(value ? TAG_TRUE : TAG_FALSE));
	}

	void Encoder::write_int(Buffer& out, int64_t value)
	{
		if (value >= 0)
		{
			write_uint(out, uint64_t(value));
		}
		else if (value >= -32)
		{
			out.push(uint8_t(int8_t(value)));
		}
		else if (value >= INT8_MIN)
		{
			out.push(uint8_t(TAG_INT8));
			out.push(uint8_t(int8_t(value)));
		}
		else if (value >= INT16_MIN)
		{
			out.push(uint8_t(TAG_INT16));
			pushBigEndian16(out, uint16_t(int16_t(value)));
		}
		else if (value >= INT32_MIN)
		{
			out.push(uint8_t(TAG_INT32));
			pushBigEndian32(out, uint32_t(int32_t(value)));
		}
		else
		{
			out.push(uint8_t(TAG_INT64));
			pushBigEndian64(out, uint64_t(value));
		}
	}

	void Encoder::write_uint(Buffer& out, uint64_t value)
	{
		if (value <= TAG_POSITIVE_FIXINT_MAX)
		{
			out.push(uint8_t(value));
		}
		else if (value <= UINT8_MAX)
		{
			out.push(uint8_t(TAG_UINT8));
			out.push(uint8_t(value));
		}
		else if (value <= UINT16_MAX)
		{
			out.push(uint8_t(TAG_UINT16));
			pushBigEndian16(out, uint16_t(value));
		}
		else if (value <= UINT32_MAX)
		{
			out.push(uint8_t(TAG_UINT32));
			pushBigEndian32(out, uint32_t(value));
		}
		else
		{
			out.push(uint8_t(TAG_UINT64));
			pushBigEndian64(out, value);
		}
	}

	void Encoder::write_float32(Buffer& out, float value)
	{
		uint32_t bits = 0;
		::memcpy(&bits, &value, sizeof(bits));
		out.push(uint8_t(TAG_FLOAT32));
		pushBigEndian32(out, bits);
	}

	void Encoder::write_float64(Buffer& out, double value)
	{
		uint64_t bits = 0;
		::memcpy(&bits, &value, sizeof(bits));
		out.push(uint8_t(TAG_FLOAT64));
		pushBigEndian64(out, bits);
	}

	Error Encoder::write_string(Buffer& out, StringView value)
	{
		if (value.count() == 0)
		{
			out.push(uint8_t(TAG_FIXSTR));
			return {};
		}

		if (value.count() < m_config.stringInlineMax)
		{
			auto count = Rune::sanitizedCount(value);
			if (auto err = writeStringHeader(m_allocator, out, count))
				return err;
			auto payload = out.extend(count);
			Rune::sanitize(value, (char*)payload.data());
			return {};
		}

		if (value.count() > UINT32_MAX)
			return errf(m_allocator, Error::KIND_ENCODING_FAILED, "string of {} bytes exceeds the str32 limit"_sv, value.count());

		// the scratch region grows by the encoded size, not the input size
		auto region = m_scratch.reserve(Rune::sanitizedCount(value));
		auto count = Rune::sanitize(value, (char*)region.data());
		if (auto err = writeStringHeader(m_allocator, out, count))
			return err;
		out.push(region.data(), count);
		return {};
	}

	Error Encoder::write_binary(Buffer& out, Span<const std::byte> value)
	{
		auto count = value.count();
		if (count <= UINT8_MAX)
		{
			out.push(uint8_t(TAG_BIN8));
			out.push(uint8_t(count));
		}
		else if (count <= UINT16_MAX)
		{
			out.push(uint8_t(TAG_BIN16));
			pushBigEndian16(out, uint16_t(count));
		}
		else if (count <= UINT32_MAX)
		{
			out.push(uint8_t(TAG_BIN32));
			pushBigEndian32(out, uint32_t(count));
		}
		else
		{
			return errf(m_allocator, Error::KIND_ENCODING_FAILED, "binary of {} bytes exceeds the bin32 limit"_sv, count);
		}

		if (count < m_config.binaryInlineMax)
		{
			for (auto b: value)
				out.push(b);
		}
		else
		{
			out.push(value);
		}
		return {};
	}

	Error Encoder::write_array_header(Buffer& out, size_t count)
	{
		if (count <= FIXARRAY_MAX)
		{
			out.push(uint8_t(TAG_FIXARRAY | count));
		}
		else if (count <= UINT16_MAX)
		{
			out.push(uint8_t(TAG_ARRAY16));
			pushBigEndian16(out, uint16_t(count));
		}
		else if (count <= UINT32_MAX)
		{
			out.push(uint8_t(TAG_ARRAY32));
			pushBigEndian32(out, uint32_t(count));
		}
		else
		{
			return errf(m_allocator, Error::KIND_ENCODING_FAILED, "array of {} elements exceeds the array32 limit"_sv, count);
		}
		return {};
	}

	Error Encoder::write_map_header(Buffer& out, size_t count)
	{
		if (count <= FIXMAP_MAX)
		{
			out.push(uint8_t(TAG_FIXMAP | count));
		}
		else if (count <= UINT16_MAX)
		{
			out.push(uint8_t(TAG_MAP16));
			pushBigEndian16(out, uint16_t(count));
		}
		else if (count <= UINT32_MAX)
		{
			out.push(uint8_t(TAG_MAP32));
			pushBigEndian32(out, uint32_t(count));
		}
		else
		{
			return errf(m_allocator, Error::KIND_ENCODING_FAILED, "map of {} entries exceeds the map32 limit"_sv, count);
		}
		return {};
	}

	Error Encoder::write_ext(Buffer& out, int8_t type, Span<const std::byte> payload)
	{
		auto count = payload.count();
		if (auto tag = fixextTag(count))
		{
			out.push(tag);
		}
		else if (count <= UINT8_MAX)
		{
			out.push(uint8_t(TAG_EXT8));
			out.push(uint8_t(count));
		}
		else if (count <= UINT16_MAX)
		{
			out.push(uint8_t(TAG_EXT16));
			pushBigEndian16(out, uint16_t(count));
		}
		else if (count <= UINT32_MAX)
		{
			out.push(uint8_t(TAG_EXT32));
			pushBigEndian32(out, uint32_t(count));
		}
		else
		{
			return errf(m_allocator, Error::KIND_ENCODING_FAILED, "ext payload of {} bytes exceeds the ext32 limit"_sv, count);
		}

		out.push(uint8_t(type));
		out.push(payload);
		return {};
	}
}
