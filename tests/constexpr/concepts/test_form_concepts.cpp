#include <FormFusion/parser.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace FormFusion;
using namespace FormFusion::static_schema;

// ============================================================================
// Leaves
// ============================================================================

static_assert(FormLeaf<int>);
static_assert(FormLeaf<std::uint8_t>);
static_assert(FormLeaf<std::int64_t>);
static_assert(FormLeaf<double>);
static_assert(FormLeaf<bool>);
static_assert(FormLeaf<std::string>);
static_assert(FormLeaf<Capped<std::string>>);
static_assert(FormLeaf<Date>);
static_assert(FormLeaf<Time>);
static_assert(FormLeaf<DateTime>);
static_assert(FormLeaf<Ipv4Address>);
static_assert(FormLeaf<IpAddress>);
static_assert(FormLeaf<SocketAddress>);
static_assert(FormLeaf<TempFile>);
static_assert(FormLeaf<Capped<TempFile>>);

// Character types are not numbers
static_assert(!FormLeaf<char>);
static_assert(!FormLeaf<std::vector<int>>);

// Only bool has a default
static_assert(LeafHasDefault<bool>);
static_assert(!LeafHasDefault<int>);
static_assert(!LeafHasDefault<std::string>);

// Data fields: text and files accept streams, numbers do not
static_assert(LeafAcceptsData<std::string, BufferDataStream>);
static_assert(LeafAcceptsData<Capped<std::string>, IstreamDataStream>);
static_assert(LeafAcceptsData<TempFile, BufferDataStream>);
static_assert(LeafAcceptsData<Capped<TempFile>, BufferDataStream>);
static_assert(!LeafAcceptsData<int, BufferDataStream>);
static_assert(!LeafAcceptsData<bool, BufferDataStream>);

static_assert(is_data_stream_like_v<BufferDataStream>);
static_assert(is_data_stream_like_v<IstreamDataStream>);
static_assert(!is_data_stream_like_v<std::string>);

// ============================================================================
// Composites
// ============================================================================

struct Flat {
    std::string name;
    int age;
};

struct Upload {
    Capped<TempFile> file;
    std::optional<std::string> note;
};

static_assert(FormStruct<Flat>);
static_assert(FormStruct<Upload>);
static_assert(!FormStruct<std::string>);
static_assert(!FormStruct<std::vector<Flat>>);
static_assert(!FormStruct<std::optional<Flat>>);
static_assert(!FormStruct<Annotated<Flat>>);
static_assert(!FormStruct<int>);

static_assert(FormVector<std::vector<int>>);
static_assert(FormOptional<std::optional<int>>);
static_assert(FormAnnotated<Annotated<int>>);
