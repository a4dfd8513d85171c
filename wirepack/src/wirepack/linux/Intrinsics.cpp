#include "wirepack/Intrinsics.h"

#include <endian.h>

namespace wirepack
{
	Endianness systemEndianness()
	{
		#if __BYTE_ORDER == __LITTLE_ENDIAN
			return Endianness::Little;
		#else
			return Endianness::Big;
		#endif
	}

	uint16_t byteswap_uint16(uint16_t value)
	{
		return __builtin_bswap16(value);
	}

	uint32_t byteswap_uint32(uint32_t value)
	{
		return __builtin_bswap32(value);
	}

	uint64_t byteswap_uint64(uint64_t value)
	{
		return __builtin_bswap64(value);
	}
}
