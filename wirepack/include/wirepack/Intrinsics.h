#pragma once

#include "wirepack/Exports.h"

#include <cstdint>

namespace wirepack
{
	enum class Endianness
	{
		Little,
		Big,
	};

	WIREPACK_EXPORT Endianness systemEndianness();
	WIREPACK_EXPORT uint16_t byteswap_uint16(uint16_t value);
	WIREPACK_EXPORT uint32_t byteswap_uint32(uint32_t value);
	WIREPACK_EXPORT uint64_t byteswap_uint64(uint64_t value);
}
