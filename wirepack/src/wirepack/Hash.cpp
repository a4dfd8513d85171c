#include "wirepack/Hash.h"

#include <cstring>

namespace wirepack
{
	inline static size_t shiftMix(size_t v)
	{
		return v ^ (v >> 47);
	}

	inline static size_t loadBytes(const unsigned char* p, size_t n)
	{
		size_t result = 0;
		while (n > 0)
		{
			--n;
			result = (result << 8) + static_cast<unsigned char>(p[n]);
		}
		return result;
	}

	size_t murmurHash(Span<const std::byte> bytes, size_t seed)
	{
		auto len = bytes.sizeInBytes();
		auto buffer = reinterpret_cast<const unsigned char*>(bytes.data());

		if constexpr (sizeof(size_t) == 4)
		{
			const size_t m = 0x5bd1e995;
			size_t hash = seed ^ len;

			while (len >= 4)
			{
				size_t k = 0;
				::memcpy(&k, buffer, 4);
				k *= m;
				k ^= k >> 24;
				k *= m;
				hash *= m;
				hash ^= k;
				buffer += 4;
				len -= 4;
			}

			if (len == 3)
				hash ^= static_cast<size_t>(buffer[2]) << 16;
			if (len >= 2)
				hash ^= static_cast<size_t>(buffer[1]) << 8;
			if (len >= 1)
			{
				hash ^= static_cast<size_t>(buffer[0]);
				hash *= m;
			}

			hash ^= hash >> 13;
			hash *= m;
			hash ^= hash >> 15;
			return hash;
		}
		else
		{
			const size_t mul = (size_t(0xc6a4a793UL) << 32UL) + size_t(0x5bd1e995UL);
			const size_t len_aligned = len & ~size_t(0x7);
			const unsigned char* const end = buffer + len_aligned;

			size_t hash = seed ^ (len * mul);
			for (auto p = buffer; p != end; p += 8)
			{
				size_t word = 0;
				::memcpy(&word, p, sizeof(word));
				const size_t data = shiftMix(word * mul) * mul;
				hash ^= data;
				hash *= mul;
			}

			if ((len & 0x7) != 0)
			{
				const size_t data = loadBytes(end, len & 0x7);
				hash ^= data;
				hash *= mul;
			}

			hash = shiftMix(hash) * mul;
			hash = shiftMix(hash);
			return hash;
		}
	}
}
