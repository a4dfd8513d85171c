#include "wirepack/Mimallocator.h"

#include <tracy/Tracy.hpp>

#include <mimalloc.h>

namespace wirepack
{
	Span<std::byte> Mimallocator::alloc(size_t size, size_t alignment)
	{
		auto res = (std::byte*)mi_malloc_aligned(size, alignment);
		TracyAllocS(res, size, 10);
		return Span<std::byte>{res, size};
	}

	void Mimallocator::commit(Span<std::byte>)
	{
		// do nothing
	}

	void Mimallocator::release(Span<std::byte>)
	{
		// do nothing
	}

	void Mimallocator::free(Span<std::byte> bytes)
	{
		TracyFreeS(bytes.data(), 10);
		mi_free(bytes.data());
	}
}
