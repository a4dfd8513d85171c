#include "wirepack/msgpack/Format.h"

namespace wirepack::msgpack
{
	StringView formatName(FORMAT format)
	{
		switch (format)
		{
		case FORMAT_POSITIVE_FIXINT: return "positive fixint"_sv;
		case FORMAT_FIXMAP: return "fixmap"_sv;
		case FORMAT_FIXARRAY: return "fixarray"_sv;
		case FORMAT_FIXSTR: return "fixstr"_sv;
		case FORMAT_NIL: return "nil"_sv;
		case FORMAT_NEVER_USED: return "never used"_sv;
		case FORMAT_FALSE: return "false"_sv;
		case FORMAT_TRUE: return "true"_sv;
		case FORMAT_BIN8: return "bin8"_sv;
		case FORMAT_BIN16: return "bin16"_sv;
		case FORMAT_BIN32: return "bin32"_sv;
		case FORMAT_EXT8: return "ext8"_sv;
		case FORMAT_EXT16: return "ext16"_sv;
		case FORMAT_EXT32: return "ext32"_sv;
		case FORMAT_FLOAT32: return "float32"_sv;
		case FORMAT_FLOAT64: return "float64"_sv;
		case FORMAT_UINT8: return "uint8"_sv;
		case FORMAT_UINT16: return "uint16"_sv;
		case FORMAT_UINT32: return "uint32"_sv;
		case FORMAT_UINT64: return "uint64"_sv;
		case FORMAT_INT8: return "int8"_sv;
		case FORMAT_INT16: return "int16"_sv;
		case FORMAT_INT32: return "int32"_sv;
		case FORMAT_INT64: return "int64"_sv;
		case FORMAT_FIXEXT1: return "fixext1"_sv;
		case FORMAT_FIXEXT2: return "fixext2"_sv;
		case FORMAT_FIXEXT4: return "fixext4"_sv;
		case FORMAT_FIXEXT8: return "fixext8"_sv;
		case FORMAT_FIXEXT16: return "fixext16"_sv;
		case FORMAT_STR8: return "str8"_sv;
		case FORMAT_STR16: return "str16"_sv;
		case FORMAT_STR32: return "str32"_sv;
		case FORMAT_ARRAY16: return "array16"_sv;
		case FORMAT_ARRAY32: return "array32"_sv;
		case FORMAT_MAP16: return "map16"_sv;
		case FORMAT_MAP32: return "map32"_sv;
		case FORMAT_NEGATIVE_FIXINT: return "negative fixint"_sv;
		default:
			unreachable();
			return "<unknown>"_sv;
		}
	}
}
