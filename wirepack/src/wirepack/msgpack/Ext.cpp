#include "wirepack/msgpack/Ext.h"

namespace wirepack::msgpack
{
	Ext::Ext(int8_t type, Span<const std::byte> payload, Allocator* allocator)
		: m_type(type),
		  m_payload(payload, allocator)
	{}
}
