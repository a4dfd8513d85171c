#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Buffer.h"

#include <cstdint>

namespace wirepack::msgpack
{
	// application defined extension value, a type tag paired with an opaque payload
	// application types live in 0..127, negative types are reserved by msgpack itself and are only produced by
	// the decoder when it meets them on the wire
	class Ext
	{
		int8_t m_type = 0;
		Buffer m_payload;

	public:
		Ext(int8_t type, Buffer payload)
			: m_type(type),
			  m_payload(std::move(payload))
		{}

		WIREPACK_EXPORT Ext(int8_t type, Span<const std::byte> payload, Allocator* allocator);

		int8_t type() const { return m_type; }
		const Buffer& payload() const { return m_payload; }
		Span<const std::byte> bytes() const { return m_payload; }
		size_t count() const { return m_payload.count(); }
		Allocator* allocator() const { return m_payload.allocator(); }

		bool isReserved() const { return m_type < 0; }

		bool operator==(const Ext& other) const { return m_type == other.m_type && m_payload == other.m_payload; }
		bool operator!=(const Ext& other) const { return !operator==(other); }
	};
}
