#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Allocator.h"

namespace wirepack
{
	// mimalloc backed allocator, a drop in replacement for Mallocator on allocation heavy decode paths
	class Mimallocator: public Allocator
	{
	public:
		WIREPACK_EXPORT Span<std::byte> alloc(size_t size, size_t alignment) override;
		WIREPACK_EXPORT void commit(Span<std::byte> bytes) override;
		WIREPACK_EXPORT void release(Span<std::byte> bytes) override;
		WIREPACK_EXPORT void free(Span<std::byte> bytes) override;
	};
}
