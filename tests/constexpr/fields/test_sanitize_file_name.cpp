#include "../test_helpers.hpp"
using namespace TestHelpers;

// ============================================================================
// Accepted names lose their directories and extension
// ============================================================================

static_assert(SanitizesTo("photo.png", "photo"));
static_assert(SanitizesTo("report", "report"));
static_assert(SanitizesTo("archive.tar.gz", "archive"));
static_assert(SanitizesTo("../../etc/passwd", "passwd"));
static_assert(SanitizesTo("/var/www/index.html", "index"));
static_assert(SanitizesTo("C:\\docs\\cv.pdf", "cv"));
static_assert(SanitizesTo("dir/sub\\mixed.txt", "mixed"));
static_assert(SanitizesTo("a*b", "a*b"));

// ============================================================================
// Rejected names
// ============================================================================

static_assert(SanitizeRejects(""));
static_assert(SanitizeRejects("dir/"));
static_assert(SanitizeRejects(".bashrc"));
static_assert(SanitizeRejects("../.hidden"));
static_assert(SanitizeRejects("*.txt"));
static_assert(SanitizeRejects("*wild"));
static_assert(SanitizeRejects("drive:"));
static_assert(SanitizeRejects("a<"));
static_assert(SanitizeRejects("a>"));
static_assert(SanitizeRejects("C:\\"));
