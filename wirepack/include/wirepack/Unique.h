#pragma once

#include "wirepack/Allocator.h"

#include <new>
#include <type_traits>
#include <utility>

namespace wirepack
{
	template<typename T>
	class Unique
	{
		template<typename>
		friend class Unique;

		Allocator* m_allocator = nullptr;
		T* m_ptr = nullptr;
		// dynamic type size, differs from sizeof(T) after an upcast
		Span<std::byte> m_memory;

		void destroy()
		{
			if (m_ptr)
			{
				m_ptr->~T();
				m_allocator->release(m_memory);
				m_allocator->free(m_memory);
				m_ptr = nullptr;
				m_memory = Span<std::byte>{};
			}
		}

		template<typename U>
		void moveFrom(Unique<U>& other)
		{
			m_allocator = other.m_allocator;
			m_ptr = other.m_ptr;
			m_memory = other.m_memory;
			other.m_ptr = nullptr;
			other.m_memory = Span<std::byte>{};
		}

	public:
		Unique() = default;

		Unique(Allocator* allocator, T* ptr, Span<std::byte> memory)
			: m_allocator(allocator),
			  m_ptr(ptr),
			  m_memory(memory)
		{}

		Unique(std::nullptr_t) {}

		Unique(const Unique&) = delete;
		Unique& operator=(const Unique&) = delete;

		Unique(Unique&& other) noexcept
		{
			moveFrom(other);
		}

		template<typename U>
		requires std::is_convertible_v<U*, T*>
		Unique(Unique<U>&& other) noexcept
		{
			moveFrom(other);
		}

		Unique& operator=(std::nullptr_t)
		{
			destroy();
			return *this;
		}

		Unique& operator=(Unique&& other) noexcept
		{
			destroy();
			moveFrom(other);
			return *this;
		}

		template<typename U>
		requires std::is_convertible_v<U*, T*>
		Unique& operator=(Unique<U>&& other) noexcept
		{
			destroy();
			moveFrom(other);
			return *this;
		}

		~Unique()
		{
			destroy();
		}

		T& operator*() const { return *m_ptr; }
		T* operator->() const { return m_ptr; }

		operator bool() const { return m_ptr != nullptr; }
		bool operator==(std::nullptr_t) const { return m_ptr == nullptr; }
		bool operator!=(std::nullptr_t) const { return m_ptr != nullptr; }

		T* get() const { return m_ptr; }
		Allocator* allocator() const { return m_allocator; }
	};

	template<typename T, typename... TArgs>
	inline Unique<T>
	unique_from(Allocator* allocator, TArgs&&... args)
	{
		auto memory = allocator->alloc(sizeof(T), alignof(T));
		allocator->commit(memory);
		auto ptr = ::new (memory.data()) T(std::forward<TArgs>(args)...);
		return Unique<T>{allocator, ptr, memory};
	}
}
