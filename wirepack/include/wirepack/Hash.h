#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Allocator.h"
#include "wirepack/Assert.h"
#include "wirepack/Span.h"

#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace wirepack
{
	constexpr size_t DEFAULT_HASH_SEED = 0xc70f6907UL;

	// hashes a block of bytes using murmur hash algorithm
	WIREPACK_EXPORT size_t murmurHash(Span<const std::byte> bytes, size_t seed = DEFAULT_HASH_SEED);

	inline size_t fnva(Span<const std::byte> bytes, size_t seed = DEFAULT_HASH_SEED)
	{
		if constexpr (sizeof(size_t) == 8)
		{
			size_t h = seed + 0xcbf29ce484222325ULL;
			for (auto b: bytes)
				h = (h ^ size_t(b)) * 0x100000001b3ULL;
			return h;
		}
		else
		{
			size_t h = seed + 0x811c9dc5UL;
			for (auto b: bytes)
				h = (h ^ size_t(b)) * 0x01000193UL;
			return h;
		}
	}

	inline size_t hashBytes(Span<const std::byte> bytes, size_t seed = DEFAULT_HASH_SEED)
	{
		if (bytes.sizeInBytes() < 8)
			return fnva(bytes, seed);
		else
			return murmurHash(bytes, seed);
	}

	template<typename T>
	struct Hash
	{
		inline size_t operator()(const T&, size_t) const
		{
			static_assert(sizeof(T) == 0, "Hash not implemented for this type");
			return 0;
		}
	};

	template<typename T>
	struct Hash<T*>
	{
		inline size_t operator()(const T* ptr, size_t seed) const
		{
			return hashBytes(Span<const std::byte>{reinterpret_cast<const std::byte*>(&ptr), sizeof(ptr)}, seed);
		}
	};

	template<>
	struct Hash<uint64_t>
	{
		inline size_t operator()(uint64_t value, size_t seed) const
		{
			return hashBytes(Span<const std::byte>{reinterpret_cast<const std::byte*>(&value), sizeof(value)}, seed);
		}
	};

	template<>
	struct Hash<int64_t>
	{
		inline size_t operator()(int64_t value, size_t seed) const
		{
			return hashBytes(Span<const std::byte>{reinterpret_cast<const std::byte*>(&value), sizeof(value)}, seed);
		}
	};

	enum HASH_FLAGS : uint8_t
	{
		HASH_EMPTY,
		HASH_USED,
	};

	// hash table slot with the index and hash
	class HashSlot
	{
		// most significant bit = HASH_FLAGS enum
		// remaining bits = index
		size_t index = 0;
		size_t hash = 0;

		static constexpr size_t FLAGS_SHIFT = sizeof(size_t) * 8 - 1;
		static constexpr size_t INDEX_MASK = ~(size_t(1) << FLAGS_SHIFT);

	public:
		HashSlot() = default;

		HASH_FLAGS flags() const { return HASH_FLAGS(index >> FLAGS_SHIFT); }
		size_t valueIndex() const { return index & INDEX_MASK; }
		size_t valueHash() const { return hash; }

		void setFlags(HASH_FLAGS f)
		{
			index &= INDEX_MASK;
			index |= (size_t(f) << FLAGS_SHIFT);
		}

		void setValueIndex(size_t value_index)
		{
			index &= ~INDEX_MASK;
			index |= (value_index & INDEX_MASK);
		}

		void setValueHash(size_t value_hash) { hash = value_hash; }
	};

	template<typename TKey, typename TValue>
	struct KeyValue
	{
		TKey key;
		TValue value;
	};

	// open addressing hash map, values are kept in insertion order in a dense array
	template<typename TKey, typename TValue, typename THash = Hash<TKey>>
	class Map
	{
		using Entry = KeyValue<const TKey, TValue>;

		Allocator* m_allocator = nullptr;
		Span<HashSlot> m_slots;
		size_t m_usedCountThreshold = 0;
		Span<Entry> m_values;
		size_t m_valuesCount = 0;

		struct Search_Result
		{
			size_t hash;
			size_t index;
		};

		void destroy()
		{
			for (size_t i = 0; i < m_valuesCount; ++i)
				m_values[i].~Entry();
			m_allocator->releaseT(m_values);
			m_allocator->freeT(m_values);

			m_allocator->releaseT(m_slots);
			m_allocator->freeT(m_slots);

			m_slots = Span<HashSlot>{};
			m_usedCountThreshold = 0;
			m_values = Span<Entry>{};
			m_valuesCount = 0;
		}

		void copyFrom(const Map& other)
		{
			m_allocator = other.m_allocator;
			m_usedCountThreshold = other.m_usedCountThreshold;
			m_valuesCount = other.m_valuesCount;

			m_values = m_allocator->allocT<Entry>(m_valuesCount);
			m_allocator->commitT(m_values);
			for (size_t i = 0; i < m_valuesCount; ++i)
				::new (&m_values[i]) Entry(other.m_values[i]);

			m_slots = m_allocator->allocT<HashSlot>(other.m_slots.count());
			m_allocator->commitT(m_slots);
			for (auto& slot: m_slots)
				::new (&slot) HashSlot();

			// the slot array moved so every hash has to be recomputed
			rehash(m_slots);
		}

		void moveFrom(Map& other)
		{
			m_allocator = other.m_allocator;
			m_slots = other.m_slots;
			m_usedCountThreshold = other.m_usedCountThreshold;
			m_values = other.m_values;
			m_valuesCount = other.m_valuesCount;

			other.m_slots = Span<HashSlot>{};
			other.m_usedCountThreshold = 0;
			other.m_values = Span<Entry>{};
			other.m_valuesCount = 0;
		}

		Search_Result findSlot(Span<const HashSlot> _slots, const TKey& key) const
		{
			Search_Result res{};
			res.hash = THash{}(key, size_t(_slots.data()));

			auto cap = _slots.count();
			if (cap == 0)
			{
				res.index = cap;
				return res;
			}

			auto index = res.hash & (cap - 1);
			auto ix = index;

			// linear probing
			while (true)
			{
				const auto& slot = _slots[ix];
				if (slot.flags() == HASH_EMPTY)
					break;

				if (slot.valueHash() == res.hash && m_values[slot.valueIndex()].key == key)
					break;

				++ix;
				ix &= (cap - 1);

				// if we went full circle then we just return the cap to signal no index has been found
				if (ix == index)
				{
					ix = cap;
					break;
				}
			}

			res.index = ix;
			return res;
		}

		void rehash(Span<HashSlot> slots)
		{
			for (size_t i = 0; i < m_valuesCount; ++i)
			{
				auto res = findSlot(slots, m_values[i].key);
				auto& slot = slots[res.index];
				validate(slot.flags() == HASH_EMPTY);
				slot.setFlags(HASH_USED);
				slot.setValueIndex(i);
				slot.setValueHash(res.hash);
			}
		}

		void reserveExact(size_t new_count)
		{
			auto new_slots = m_allocator->allocT<HashSlot>(new_count);
			m_allocator->commitT(new_slots);
			for (auto& slot: new_slots)
				::new (&slot) HashSlot();

			// if 12/16th of table is occupied, grow
			m_usedCountThreshold = new_count - (new_count >> 2);

			rehash(new_slots);

			m_allocator->releaseT(m_slots);
			m_allocator->freeT(m_slots);
			m_slots = new_slots;
		}

		void maintainSpaceComplexity()
		{
			if (m_slots.count() == 0)
				reserveExact(8);
			else if (m_valuesCount + 1 > m_usedCountThreshold)
				reserveExact(m_slots.count() * 2);
		}

		void valuesGrow(size_t new_capacity)
		{
			auto new_values = m_allocator->allocT<Entry>(new_capacity);
			m_allocator->commitT(new_values);
			for (size_t i = 0; i < m_valuesCount; ++i)
			{
				::new (&new_values[i]) Entry(std::move(m_values[i]));
				m_values[i].~Entry();
			}

			m_allocator->releaseT(m_values);
			m_allocator->freeT(m_values);

			m_values = new_values;
		}

		template<typename R, typename U>
		void valuesPush(R&& key, U&& value)
		{
			if (m_valuesCount + 1 > m_values.count())
			{
				size_t new_capacity = m_values.count() * 2;
				if (new_capacity == 0)
					new_capacity = 8;
				valuesGrow(new_capacity);
			}
			::new (&m_values[m_valuesCount]) Entry{std::forward<R>(key), std::forward<U>(value)};
			++m_valuesCount;
		}

	public:
		using ConstIterator = const Entry*;

		explicit Map(Allocator* a)
			: m_allocator(a)
		{}

		Map(const Map& other)
		{
			copyFrom(other);
		}

		Map(Map&& other) noexcept
		{
			moveFrom(other);
		}

		Map& operator=(const Map& other)
		{
			if (this == &other)
				return *this;
			destroy();
			copyFrom(other);
			return *this;
		}

		Map& operator=(Map&& other) noexcept
		{
			if (this == &other)
				return *this;
			destroy();
			moveFrom(other);
			return *this;
		}

		~Map()
		{
			destroy();
		}

		// inserts the key if it's not already in the map, an existing key keeps its value
		template<typename R, typename U>
		void insert(R&& key, U&& value)
		{
			maintainSpaceComplexity();

			auto res = findSlot(m_slots, key);
			auto& slot = m_slots[res.index];
			if (slot.flags() == HASH_USED)
				return;

			slot.setFlags(HASH_USED);
			slot.setValueIndex(m_valuesCount);
			slot.setValueHash(res.hash);
			valuesPush(std::forward<R>(key), std::forward<U>(value));
		}

		void clear()
		{
			for (auto& slot: m_slots)
				slot = HashSlot{};
			for (size_t i = 0; i < m_valuesCount; ++i)
				m_values[i].~Entry();
			m_valuesCount = 0;
		}

		Allocator* allocator() const { return m_allocator; }
		size_t count() const { return m_valuesCount; }
		size_t capacity() const { return m_slots.count(); }

		void reserve(size_t added_count)
		{
			auto new_cap = m_valuesCount + added_count;
			new_cap *= 4;
			new_cap = new_cap / 3 + 1;
			if (new_cap > m_usedCountThreshold)
			{
				// round up to next power of 2
				size_t pow2 = 8;
				while (pow2 < new_cap)
					pow2 *= 2;
				reserveExact(pow2);
			}
		}

		ConstIterator lookup(const TKey& key) const
		{
			auto res = findSlot(m_slots, key);
			if (res.index == m_slots.count() || m_slots[res.index].flags() == HASH_EMPTY)
				return end();
			return &m_values[m_slots[res.index].valueIndex()];
		}

		ConstIterator begin() const { return m_values.data(); }
		ConstIterator end() const { return m_values.data() + m_valuesCount; }
	};
}
