#include <FormFusion/field_parsers.hpp>

using FormFusion::field_parsers_detail::is_valid_utf8;
using FormFusion::field_parsers_detail::incomplete_utf8_tail;

static_assert(is_valid_utf8(""));
static_assert(is_valid_utf8("plain ascii"));
static_assert(is_valid_utf8("gr\xC3\xBC\xC3\x9F" "e"));           // grüße
static_assert(is_valid_utf8("\xE2\x82\xAC"));                      // euro sign
static_assert(is_valid_utf8("\xF0\x9F\x98\x80"));                  // emoji

// Lone continuation byte
static_assert(!is_valid_utf8("\x80"));
// Truncated sequence
static_assert(!is_valid_utf8("\xE2\x82"));
// Overlong encoding of '/'
static_assert(!is_valid_utf8("\xC0\xAF"));
// UTF-16 surrogate
static_assert(!is_valid_utf8("\xED\xA0\x80"));
// Above U+10FFFF
static_assert(!is_valid_utf8("\xF4\x90\x80\x80"));
// Invalid lead byte
static_assert(!is_valid_utf8("\xFF"));

// Unfinished tail after a cut
static_assert(incomplete_utf8_tail("") == 0);
static_assert(incomplete_utf8_tail("abc") == 0);
static_assert(incomplete_utf8_tail("\xC3\xA9") == 0);
static_assert(incomplete_utf8_tail("\xC3\xA9\xC3") == 1);
static_assert(incomplete_utf8_tail("a\xE2\x82") == 2);
static_assert(incomplete_utf8_tail("\xF0\x9F\x98") == 3);
static_assert(incomplete_utf8_tail("\xF0\x9F\x98\x80") == 0);
// Not a prefix of any sequence
static_assert(incomplete_utf8_tail("\x80\x80\x80") == 0);
static_assert(incomplete_utf8_tail("a\xFF") == 0);
