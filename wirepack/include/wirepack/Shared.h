#pragma once

#include "wirepack/Allocator.h"
#include "wirepack/Assert.h"

#include <atomic>
#include <new>
#include <type_traits>
#include <utility>

namespace wirepack
{
	struct SharedControlBlock
	{
		Allocator* allocator = nullptr;
		Span<std::byte> originalMemory;
		std::atomic<int> strong = 0;
	};

	template<typename T>
	class Shared
	{
		template<typename>
		friend class Shared;

		SharedControlBlock* m_control = nullptr;
		T* m_ptr = nullptr;

		void ref()
		{
			if (m_control)
				m_control->strong.fetch_add(1);
		}

		void unref()
		{
			if (m_control == nullptr)
				return;

			if (m_control->strong.fetch_sub(1) == 1)
			{
				auto allocator = m_control->allocator;
				auto memory = m_control->originalMemory;
				m_ptr->~T();
				allocator->release(memory);
				allocator->free(memory);
				allocator->releaseSingleT(m_control);
				allocator->freeSingleT(m_control);
			}
			m_control = nullptr;
			m_ptr = nullptr;
		}

		template<typename U>
		void copyFrom(const Shared<U>& other)
		{
			m_control = other.m_control;
			m_ptr = other.m_ptr;
			ref();
		}

		template<typename U>
		void moveFrom(Shared<U>& other)
		{
			m_control = other.m_control;
			m_ptr = other.m_ptr;
			other.m_control = nullptr;
			other.m_ptr = nullptr;
		}

	public:
		Shared() = default;

		Shared(T* ptr, SharedControlBlock* control)
			: m_control(control),
			  m_ptr(ptr)
		{
			ref();
		}

		Shared(std::nullptr_t) {}

		Shared(const Shared& other)
		{
			copyFrom(other);
		}

		template<typename U>
		requires std::is_convertible_v<U*, T*>
		Shared(const Shared<U>& other)
		{
			copyFrom(other);
		}

		Shared(Shared&& other) noexcept
		{
			moveFrom(other);
		}

		template<typename U>
		requires std::is_convertible_v<U*, T*>
		Shared(Shared<U>&& other) noexcept
		{
			moveFrom(other);
		}

		Shared& operator=(std::nullptr_t)
		{
			unref();
			return *this;
		}

		Shared& operator=(const Shared& other)
		{
			if (this == &other)
				return *this;
			unref();
			copyFrom(other);
			return *this;
		}

		Shared& operator=(Shared&& other) noexcept
		{
			unref();
			moveFrom(other);
			return *this;
		}

		~Shared()
		{
			unref();
		}

		T& operator*() const { return *m_ptr; }
		T* operator->() const { return m_ptr; }

		operator bool() const { return m_ptr != nullptr; }
		bool operator==(std::nullptr_t) const { return m_ptr == nullptr; }
		bool operator!=(std::nullptr_t) const { return m_ptr != nullptr; }
		template<typename R>
		bool operator==(const Shared<R>& other) const { return m_ptr == other.m_ptr; }
		template<typename R>
		bool operator!=(const Shared<R>& other) const { return m_ptr != other.m_ptr; }

		int ref_count() const
		{
			if (m_control == nullptr)
				return 0;
			return m_control->strong.load();
		}

		T* get() const { return m_ptr; }

		Allocator* allocator() const
		{
			if (m_control == nullptr)
				return nullptr;
			return m_control->allocator;
		}
	};

	template<typename T, typename ... TArgs>
	inline Shared<T>
	shared_from(Allocator* allocator, TArgs&& ... args)
	{
		auto ptr = allocator->allocSingleT<T>();
		allocator->commitSingleT(ptr);

		auto control = allocator->allocSingleT<SharedControlBlock>();
		allocator->commitSingleT(control);

		::new (ptr) T(std::forward<TArgs>(args)...);
		::new (control) SharedControlBlock{};
		control->allocator = allocator;
		control->originalMemory = Span<std::byte>{reinterpret_cast<std::byte*>(ptr), sizeof(T)};

		return Shared<T>{ptr, control};
	}
}
