#include "wirepack/Intrinsics.h"

#include <stdlib.h>

namespace wirepack
{
	Endianness systemEndianness()
	{
		// every windows target we build for is little endian
		return Endianness::Little;
	}

	uint16_t byteswap_uint16(uint16_t value)
	{
		return _byteswap_ushort(value);
	}

	uint32_t byteswap_uint32(uint32_t value)
	{
		return _byteswap_ulong(value);
	}

	uint64_t byteswap_uint64(uint64_t value)
	{
		return _byteswap_uint64(value);
	}
}
