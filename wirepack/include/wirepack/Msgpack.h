#pragma once

#include "wirepack/msgpack/Format.h"
#include "wirepack/msgpack/Ext.h"
#include "wirepack/msgpack/Value.h"
#include "wirepack/msgpack/Error.h"
#include "wirepack/msgpack/Codec.h"
#include "wirepack/msgpack/Scratch.h"
#include "wirepack/msgpack/Encoder.h"
#include "wirepack/msgpack/Decoder.h"
#include "wirepack/msgpack/UndefinedCodec.h"
