#include "wirepack/msgpack/Error.h"

namespace wirepack::msgpack
{
	StringView errorKindName(Error::KIND kind)
	{
		switch (kind)
		{
		case Error::KIND_NONE: return "none"_sv;
		case Error::KIND_ENCODING_FAILED: return "encoding failed"_sv;
		case Error::KIND_TRUNCATED_INPUT: return "truncated input"_sv;
		case Error::KIND_INVALID_FORMAT: return "invalid format"_sv;
		case Error::KIND_INVALID_CODEC: return "invalid codec"_sv;
		default:
			unreachable();
			return "<unknown>"_sv;
		}
	}
}
