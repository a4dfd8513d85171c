#pragma once

#include "wirepack/Unique.h"

#include <functional>
#include <type_traits>

namespace wirepack
{
	template<typename>
	class Func;

	// move-only type erased callable, small callables live inline and larger ones go through the allocator
	template<typename TReturn, typename ... TArgs>
	class Func<TReturn(TArgs...)>
	{
		struct Concept
		{
			void (*dtor)(void*) noexcept;
			void (*move)(void*, void*) noexcept;
			TReturn (*invoke)(void*, TArgs&& ...);
		};

		static constexpr size_t SMALL_SIZE = sizeof(void*) * 4;
		static constexpr Concept EMPTY_CONCEPT{[](void*) noexcept {}, [](void*, void*) noexcept {}, nullptr};
		alignas(std::max_align_t) std::byte m_model[SMALL_SIZE];
		const Concept* m_concept = &EMPTY_CONCEPT;

		template<typename TFunc, bool IsSmall>
		struct Model;

		template<typename TFunc>
		struct Model<TFunc, true>
		{
			TFunc m_func;

			template<typename F>
			Model(Allocator*, F&& f)
				: m_func(std::forward<F>(f))
			{}

			static void dtor(void* self) noexcept { static_cast<Model*>(self)->~Model(); }
			static void move(void* self, void* p) noexcept
			{
				::new (p) Model(std::move(*static_cast<Model*>(self)));
			}
			static TReturn invoke(void* self, TArgs&& ... args)
			{
				return std::invoke(static_cast<Model*>(self)->m_func, std::forward<TArgs>(args)...);
			}

			static constexpr Concept vtable{dtor, move, invoke};
		};

		template<typename TFunc>
		struct Model<TFunc, false>
		{
			Unique<TFunc> m_func;

			template<typename F>
			Model(Allocator* allocator, F&& f)
				: m_func(unique_from<TFunc>(allocator, std::forward<F>(f)))
			{}

			static void dtor(void* self) noexcept { static_cast<Model*>(self)->~Model(); }
			static void move(void* self, void* p) noexcept
			{
				::new (p) Model(std::move(*static_cast<Model*>(self)));
			}
			static TReturn invoke(void* self, TArgs&& ... args)
			{
				return std::invoke(*static_cast<Model*>(self)->m_func, std::forward<TArgs>(args)...);
			}

			static constexpr Concept vtable{dtor, move, invoke};
		};

		void moveFrom(Func& other)
		{
			m_concept = other.m_concept;
			m_concept->move(&other.m_model, &m_model);
			m_concept->dtor(&other.m_model);
			other.m_concept = &EMPTY_CONCEPT;
		}

	public:
		Func() = default;

		Func(std::nullptr_t) {}

		template<typename F>
		requires (std::is_same_v<std::decay_t<F>, Func> == false && std::is_invocable_r_v<TReturn, std::decay_t<F>&, TArgs...>)
		Func(F&& f)
		{
			constexpr bool is_small = sizeof(Model<std::decay_t<F>, true>) <= SMALL_SIZE;
			static_assert(is_small, "large callables need an allocator");
			::new (&m_model) Model<std::decay_t<F>, true>(nullptr, std::forward<F>(f));
			m_concept = &Model<std::decay_t<F>, true>::vtable;
		}

		template<typename F>
		Func(Allocator* allocator, F&& f)
		{
			constexpr bool is_small = sizeof(Model<std::decay_t<F>, true>) <= SMALL_SIZE;
			::new (&m_model) Model<std::decay_t<F>, is_small>(allocator, std::forward<F>(f));
			m_concept = &Model<std::decay_t<F>, is_small>::vtable;
		}

		Func(const Func&) = delete;
		Func& operator=(const Func&) = delete;

		Func(Func&& other) noexcept
		{
			moveFrom(other);
		}

		Func& operator=(Func&& other) noexcept
		{
			if (this == &other)
				return *this;
			m_concept->dtor(&m_model);
			moveFrom(other);
			return *this;
		}

		~Func() { m_concept->dtor(&m_model); }

		TReturn operator()(TArgs ... args)
		{
			validate(m_concept != &EMPTY_CONCEPT);
			return m_concept->invoke(&m_model, std::forward<TArgs>(args)...);
		}

		operator bool() const { return m_concept != &EMPTY_CONCEPT; }
	};
}
