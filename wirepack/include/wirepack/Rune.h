#pragma once

#include "wirepack/Exports.h"
#include "wirepack/StringView.h"

#include <cstddef>
#include <cstdint>

namespace wirepack
{
	class Rune
	{
		int32_t m_value = 0;
	public:
		static constexpr int32_t REPLACEMENT = 0xFFFD;
		// the longest byte sequence a single malformed input byte can turn into after sanitization
		static constexpr size_t MAX_SANITIZED_EXPANSION = 3;

		Rune() = default;
		explicit Rune(int32_t value)
			: m_value(value)
		{}
		operator int32_t() const { return m_value; }

		bool operator==(const Rune& other) const { return m_value == other.m_value; }
		bool operator!=(const Rune& other) const { return m_value != other.m_value; }

		WIREPACK_EXPORT bool isValid() const;
		WIREPACK_EXPORT size_t size() const;

		// decodes the rune at ptr and returns the number of bytes consumed (at least 1), malformed input
		// decodes to the replacement rune and consumes a single byte
		WIREPACK_EXPORT static size_t decode(const char* ptr, size_t count, Rune& rune);
		WIREPACK_EXPORT static size_t encode(Rune rune, char* ptr);

		WIREPACK_EXPORT static bool isValidUtf8(StringView str);
		// byte count of str once every malformed sequence is replaced with U+FFFD
		WIREPACK_EXPORT static size_t sanitizedCount(StringView str);
		// writes the sanitized form of str into out and returns the bytes written, out must hold at least
		// sanitizedCount(str) bytes
		WIREPACK_EXPORT static size_t sanitize(StringView str, char* out);
	};
}
