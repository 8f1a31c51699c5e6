#ifndef ANYKEY_CODEC_HPP
#define ANYKEY_CODEC_HPP

#include <anykey/codec/collections.hpp>
#include <anykey/codec/embedding.hpp>
#include <anykey/codec/errors.hpp>
#include <anykey/codec/key_transcoding.hpp>
#include <anykey/codec/map_codec.hpp>

#endif
