#pragma once

#include "wirepack/Span.h"

#include <cstddef>

namespace wirepack
{
	class Allocator
	{
	public:
		virtual ~Allocator() = default;

		virtual Span<std::byte> alloc(size_t size, size_t alignment) = 0;
		virtual void commit(Span<std::byte> bytes) = 0;
		virtual void release(Span<std::byte> bytes) = 0;
		virtual void free(Span<std::byte> bytes) = 0;

		template<typename T>
		Span<T> allocT(size_t count)
		{
			auto bytes = alloc(count * sizeof(T), alignof(T));
			return Span<T>{(T*)bytes.data(), bytes.count() / sizeof(T)};
		}

		template<typename T>
		void commitT(Span<T> s) { commit(asWritableBytes(s)); }

		template<typename T>
		void releaseT(Span<T> s) { release(asWritableBytes(s)); }

		template<typename T>
		void freeT(Span<T> s) { free(asWritableBytes(s)); }

		template<typename T>
		T* allocSingleT() { return allocT<T>(1).data(); }

		template<typename T>
		void commitSingleT(T* p) { commitT(Span<T>{p, 1}); }

		template<typename T>
		void releaseSingleT(T* p) { releaseT(Span<T>{p, 1}); }

		template<typename T>
		void freeSingleT(T* p) { freeT(Span<T>{p, 1}); }
	};
}
