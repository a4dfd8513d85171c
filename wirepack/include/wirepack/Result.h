#pragma once

#include "wirepack/Assert.h"

#include <new>
#include <type_traits>
#include <utility>

namespace wirepack
{
	// holds a value, an error or nothing at all, the empty state is used by callers that may decline to
	// produce a value without failing
	template<typename T, typename E>
	class Result
	{
		enum STATE
		{
			STATE_EMPTY,
			STATE_VALUE,
			STATE_ERROR,
		};

		static constexpr auto SIZE = sizeof(T) > sizeof(E) ? sizeof(T) : sizeof(E);
		static constexpr auto ALIGNMENT = alignof(T) > alignof(E) ? alignof(T) : alignof(E);
		alignas(ALIGNMENT) unsigned char m_storage[SIZE];
		STATE m_state = STATE_EMPTY;

		void destroy()
		{
			switch (m_state)
			{
			case STATE_EMPTY:
				break;
			case STATE_VALUE:
				((T*)m_storage)->~T();
				break;
			case STATE_ERROR:
				((E*)m_storage)->~E();
				break;
			default:
				unreachable();
				break;
			}
			m_state = STATE_EMPTY;
		}

		void copyFrom(const Result& other)
		{
			m_state = other.m_state;
			switch (m_state)
			{
			case STATE_EMPTY:
				break;
			case STATE_VALUE:
				::new (m_storage) T(*(const T*)other.m_storage);
				break;
			case STATE_ERROR:
				::new (m_storage) E(*(const E*)other.m_storage);
				break;
			default:
				unreachable();
				break;
			}
		}

		void moveFrom(Result& other)
		{
			m_state = other.m_state;
			switch (m_state)
			{
			case STATE_EMPTY:
				break;
			case STATE_VALUE:
				::new (m_storage) T(std::move(*(T*)other.m_storage));
				((T*)other.m_storage)->~T();
				break;
			case STATE_ERROR:
				::new (m_storage) E(std::move(*(E*)other.m_storage));
				((E*)other.m_storage)->~E();
				break;
			default:
				unreachable();
				break;
			}
			other.m_state = STATE_EMPTY;
		}

		Result() = default;

	public:
		static Result createEmpty() { return Result{}; }

		template<typename U>
		requires (
			std::is_same_v<std::remove_cvref_t<U>, Result> == false &&
			std::is_same_v<std::remove_cvref_t<U>, E> == false &&
			std::is_constructible_v<T, U&&>
		)
		Result(U&& value)
		{
			::new (m_storage) T(std::forward<U>(value));
			m_state = STATE_VALUE;
		}

		Result(E&& error)
		{
			::new (m_storage) E(std::move(error));
			m_state = STATE_ERROR;
		}

		Result(const Result& other)
		{
			copyFrom(other);
		}

		Result(Result&& other) noexcept
		{
			moveFrom(other);
		}

		Result& operator=(const Result& other)
		{
			if (this == &other)
				return *this;
			destroy();
			copyFrom(other);
			return *this;
		}

		Result& operator=(Result&& other) noexcept
		{
			if (this == &other)
				return *this;
			destroy();
			moveFrom(other);
			return *this;
		}

		~Result()
		{
			destroy();
		}

		bool isError() const { return m_state == STATE_ERROR; }
		bool isValue() const { return m_state == STATE_VALUE; }
		bool isEmpty() const { return m_state == STATE_EMPTY; }

		T& value()
		{
			validate(m_state == STATE_VALUE);
			return *reinterpret_cast<T*>(m_storage);
		}
		const T& value() const
		{
			validate(m_state == STATE_VALUE);
			return *reinterpret_cast<const T*>(m_storage);
		}

		E& error()
		{
			validate(m_state == STATE_ERROR);
			return *reinterpret_cast<E*>(m_storage);
		}
		const E& error() const
		{
			validate(m_state == STATE_ERROR);
			return *reinterpret_cast<const E*>(m_storage);
		}

		T releaseValue()
		{
			validate(m_state == STATE_VALUE);
			T res = std::move(*reinterpret_cast<T*>(m_storage));
			destroy();
			return res;
		}

		E releaseError()
		{
			validate(m_state == STATE_ERROR);
			E res = std::move(*reinterpret_cast<E*>(m_storage));
			destroy();
			return res;
		}
	};
}
