#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Array.h"
#include "wirepack/Buffer.h"
#include "wirepack/Result.h"
#include "wirepack/Unique.h"
#include "wirepack/msgpack/Error.h"
#include "wirepack/msgpack/Value.h"

#include <cstdint>
#include <utility>

namespace wirepack::msgpack
{
	class Encoder;

	// maps an application value to an ext payload and back
	class Codec
	{
	public:
		virtual ~Codec() = default;

		// ext type claimed by this codec, must be in 0..127
		virtual int8_t type() const = 0;
		virtual bool supports(const Value& value) const = 0;
		// an empty result declines the value and lets the next codec try
		virtual Result<Buffer, Error> encode(Encoder& encoder, const Value& value) = 0;
		virtual Result<Value, Error> decode(Span<const std::byte> payload, Allocator* allocator) = 0;
	};

	class CodecRegistry
	{
		Array<Unique<Codec>> m_codecs;

	public:
		explicit CodecRegistry(Allocator* allocator)
			: m_codecs(allocator)
		{}

		Allocator* allocator() const { return m_codecs.allocator(); }
		size_t count() const { return m_codecs.count(); }
		Codec* operator[](size_t i) const { return m_codecs[i].get(); }

		WIREPACK_EXPORT Error add(Unique<Codec> codec);

		template<typename T, typename... TArgs>
		Error emplace(TArgs&&... args)
		{
			return add(unique_from<T>(allocator(), std::forward<TArgs>(args)...));
		}

		// earliest registered codec claiming the type, nullptr if none does
		WIREPACK_EXPORT Codec* findByType(int8_t type) const;
	};
}
