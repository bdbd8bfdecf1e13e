#include <fxd/fxd.hpp>
#include <iostream>
#include <fstream>
#include <cassert>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

using namespace fxd;

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

static size_t find_bytes(const std::vector<uint8_t>& haystack, const std::string& needle) {
    for (size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        if (std::memcmp(haystack.data() + i, needle.data(), needle.size()) == 0) return i;
    }
    return std::string::npos;
}

// Structural equality of two graphs below the given nodes
static bool same_tree(const GraphNode& a, const GraphNode& b) {
    if (a.id() != b.id() || a.type() != b.type()) return false;
    if (a.value() != b.value() || a.meta() != b.meta()) return false;
    if (a.proto() != b.proto()) return false;
    ChildList ca = a.children();
    ChildList cb = b.children();
    if (ca.size() != cb.size()) return false;
    for (size_t i = 0; i < ca.size(); ++i) {
        if (ca[i].first != cb[i].first) return false;
        if (!same_tree(*ca[i].second, *cb[i].second)) return false;
    }
    return true;
}

// root
//  ├─ docs (folder)        meta {color: blue}
//  │   └─ readme           value "hello", proto "text"
//  │       └─ section      value 3.5
//  └─ code (folder)
//      └─ snip (snippet)   meta {id: snip-1, lang: ts}, value [1, "two", true]
static void build_sample(MemoryGraph& g) {
    MemoryNode& docs = g.ensure("docs", "docs-id");
    docs.set_type("folder");
    docs.set_meta(Value::map({{"color", "blue"}}));

    MemoryNode& readme = g.ensure("docs.readme", "readme-id");
    readme.set_value("hello");
    readme.set_proto(std::string("text"));

    MemoryNode& section = g.ensure("docs.readme.section", "section-id");
    section.set_value(3.5);

    MemoryNode& code = g.ensure("code", "code-id");
    code.set_type("folder");

    MemoryNode& snip = g.ensure("code.snip", "snip-id");
    snip.set_type("snippet");
    snip.set_meta(Value::map({{"id", "snip-1"}, {"lang", "ts"}}));
    snip.set_value(Value::array({Value(1), Value("two"), Value(true)}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Value and UArr
// ═══════════════════════════════════════════════════════════════════════════

void test_crc32() {
    std::cout << "Testing CRC32..." << std::endl;

    const char* check = "123456789";
    assert(crc32(reinterpret_cast<const uint8_t*>(check), 9) == 0xCBF43926u);

    // Incremental update matches one-shot
    uint32_t state = crc32_update(0xFFFFFFFFu, reinterpret_cast<const uint8_t*>(check), 4);
    state = crc32_update(state, reinterpret_cast<const uint8_t*>(check) + 4, 5);
    assert(crc32_final(state) == 0xCBF43926u);

    std::cout << "  PASS" << std::endl;
}

void test_value_equality() {
    std::cout << "Testing Value equality..." << std::endl;

    Value a = Value::map({{"x", 1}, {"y", "two"}});
    Value b = Value::map({{"y", "two"}, {"x", 1}});
    assert(a == b);

    assert(Value(5) == Value(static_cast<uint64_t>(5)));
    assert(Value(-1) != Value(std::numeric_limits<uint64_t>::max()));
    assert(Value() != Value::undefined());
    assert(Value(1) != Value(1.0));

    Value m = Value::map();
    m.set("k", 1);
    m.set("k", 2);
    assert(m.size() == 1);
    assert(*m.find("k") == Value(2));
    assert(m.erase("k"));
    assert(!m.contains("k"));

    std::cout << "  PASS" << std::endl;
}

void test_value_json() {
    std::cout << "Testing Value <-> JSON..." << std::endl;

    Uuid id;
    assert(Uuid::from_string("00112233-4455-6677-8899-aabbccddeeff", id));
    assert(id.to_string() == "00112233-4455-6677-8899-aabbccddeeff");

    Value v = Value::map({
        {"n", 42},
        {"f", 1.25},
        {"s", "text"},
        {"list", Value::array({Value(true), Value(), Value("x")})},
        {"ref", Value::node_ref("node-7")},
        {"at", Value::time(1700000000000000000ULL)},
        {"uuid", Value(id)},
        {"raw", Value::bytes({1, 2, 3})},
    });

    json j = v;
    assert(j["n"] == 42);
    assert(j["ref"]["$ref"] == "node-7");

    Value back = j.get<Value>();
    assert(back == v);

    std::cout << "  PASS" << std::endl;
}

void test_uarr_roundtrip() {
    std::cout << "Testing UArr round-trip..." << std::endl;

    Value v = Value::map({
        {"i8", 127}, {"i16", 128}, {"i16n", -129}, {"i16max", 32767},
        {"i32", 32768}, {"i32max", 2147483647}, {"i32min", -2147483647 - 1},
        {"i64", 2147483648LL}, {"i64n", -2147483649LL},
        {"u64", std::numeric_limits<uint64_t>::max()},
        {"f", 3.14159}, {"b", false}, {"nil", Value()}, {"undef", Value::undefined()},
        {"s", "héllo"}, {"empty", ""},
        {"bytes", Value::bytes({0, 255, 7})},
        {"mixed", Value::array({Value(1), Value("a"), Value(2.5), Value::array({Value(-3)}),
                                Value::map({{"deep", true}})})},
        {"nested", Value::map({{"a", 1}, {"b", Value::map({{"c", "d"}})}})},
        {"ref", Value::node_ref("n-1")},
        {"ts", Value::time(123456789)},
    });

    Value back = decode(encode(v));
    assert(back == v);
    assert(back.find("undef")->is_undefined());
    assert(back.find("nil")->is_null());

    // Empty map is a zero-field record
    std::vector<uint8_t> empty = encode(Value::map());
    assert(empty.size() == UARR_HEADER_SIZE);
    assert(UArrReader(empty).field_count() == 0);
    assert(decode(empty) == Value::map());

    std::cout << "  PASS" << std::endl;
}

void test_uarr_narrowest_width() {
    std::cout << "Testing UArr narrowest integer width..." << std::endl;

    auto tag_of = [](Value v) {
        std::vector<uint8_t> buf = encode(Value::map({{"n", std::move(v)}}));
        return UArrReader(buf).tag(0);
    };

    assert(tag_of(127) == TypeTag::I8);
    assert(tag_of(-128) == TypeTag::I8);
    assert(tag_of(128) == TypeTag::I16);
    assert(tag_of(32767) == TypeTag::I16);
    assert(tag_of(32768) == TypeTag::I32);
    assert(tag_of(-32769) == TypeTag::I32);
    assert(tag_of(2147483648LL) == TypeTag::I64);
    assert(tag_of(static_cast<uint8_t>(200)) == TypeTag::U8);
    assert(tag_of(static_cast<uint64_t>(70000)) == TypeTag::U32);
    assert(tag_of(1.0f) == TypeTag::F64);
    assert(tag_of("s") == TypeTag::String);

    std::cout << "  PASS" << std::endl;
}

void test_uarr_field_order() {
    std::cout << "Testing UArr field order independence..." << std::endl;

    Value a = Value::map({{"alpha", 1}, {"beta", "b"}, {"gamma", true}});
    Value b = Value::map({{"gamma", true}, {"alpha", 1}, {"beta", "b"}});

    assert(decode(encode(a)) == decode(encode(b)));
    assert(decode(encode(b)) == a);

    std::cout << "  PASS" << std::endl;
}

void test_uarr_value_wrapping() {
    std::cout << "Testing UArr __value wrapping..." << std::endl;

    assert(decode(encode(Value(42))) == Value(42));
    assert(decode(encode(Value("bare"))) == Value("bare"));
    assert(decode(encode(Value())).is_null());

    Value arr = Value::array({Value(1), Value("x")});
    assert(decode(encode(arr)) == arr);

    std::vector<uint8_t> buf = encode(Value(7));
    UArrReader reader(buf);
    assert(reader.field_count() == 1);
    assert(reader.name(0) == UARR_VALUE_FIELD);

    std::cout << "  PASS" << std::endl;
}

void test_uarr_reader_access() {
    std::cout << "Testing UArr single-field access..." << std::endl;

    std::vector<uint8_t> buf = encode(Value::map({{"id", "n-9"}, {"count", 3}, {"meta", Value::map({{"k", "v"}})}}));
    UArrReader reader(buf);

    assert(reader.field_count() == 3);
    assert(reader.has("count"));
    assert(!reader.has("missing"));
    assert(*reader.get("id") == Value("n-9"));
    assert(*reader.get("count") == Value(3));
    assert(reader.get("meta")->find("k")->as_string() == "v");
    assert(!reader.get("missing").has_value());
    assert(fnv1a("id") == fnv1a(std::string("id")));
    assert(fnv1a("") == 0x811c9dc5u);

    // Names hash by UTF-16 code unit, matching JavaScript writers
    assert(fnv1a("a") == 0xe40c292cu);
    assert(fnv1a("h\xc3\xa9llo") == 0xf1e5b55fu);
    assert(fnv1a("\xf0\x9f\x98\x80") == 0xcb31c4b8u);

    std::vector<uint8_t> accented = encode(Value::map({{"h\xc3\xa9llo", 1}, {"\xf0\x9f\x98\x80", 2}}));
    UArrReader names(accented);
    assert(*names.get("h\xc3\xa9llo") == Value(1));
    assert(*names.get("\xf0\x9f\x98\x80") == Value(2));

    std::cout << "  PASS" << std::endl;
}

void test_uarr_format_errors() {
    std::cout << "Testing UArr FormatError..." << std::endl;

    std::vector<uint8_t> good = encode(Value::map({{"a", "some text"}, {"b", 1}}));

    // Bad magic
    {
        std::vector<uint8_t> bad = good;
        bad[0] ^= 0xFF;
        bool threw = false;
        try { decode(bad); } catch (const FormatError&) { threw = true; }
        assert(threw);
    }

    // Buffer shorter than declared
    {
        std::vector<uint8_t> bad(good.begin(), good.end() - 3);
        bool threw = false;
        try { decode(bad); } catch (const FormatError&) { threw = true; }
        assert(threw);
    }

    // Field data offset past the buffer
    {
        std::vector<uint8_t> bad = good;
        uint32_t schema = load_le<uint32_t>(bad.data() + 12);
        store_le<uint32_t>(bad.data() + schema + 12, 0x7FFFFFFFu);
        bool threw = false;
        try { decode(bad); } catch (const FormatError&) { threw = true; }
        assert(threw);
    }

    // Unknown type tag
    {
        std::vector<uint8_t> bad = good;
        uint32_t schema = load_le<uint32_t>(bad.data() + 12);
        bad[schema + 8] = 0x7E;
        bool threw = false;
        try { decode(bad); } catch (const FormatError&) { threw = true; }
        assert(threw);
    }

    // Too short for a header
    {
        std::vector<uint8_t> bad(10, 0);
        bool threw = false;
        try { decode(bad); } catch (const FormatError&) { threw = true; }
        assert(threw);
    }

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// WAL
// ═══════════════════════════════════════════════════════════════════════════

void test_wal_sequence() {
    std::cout << "Testing WAL sequence and recovery..." << std::endl;

    const std::string path = "/tmp/fxd_test_seq.fxwal";
    std::system("rm -f /tmp/fxd_test_seq.fxwal*");

    {
        WriteAheadLog wal(path);
        wal.open();
        for (int i = 1; i <= 5; ++i) {
            uint64_t seq = wal.append(RecordType::NodeCreate, "node-" + std::to_string(i),
                                      Value::map({{"n", i}}));
            assert(seq == static_cast<uint64_t>(i));
        }
        WalStats s = wal.stats();
        assert(s.record_count == 5);
        assert(s.oldest_seq == 1);
        assert(s.newest_seq == 5);
        assert(s.byte_size > WAL_HEADER_SIZE);
    }

    // Reopen recovers the sequence
    {
        WriteAheadLog wal(path);
        wal.open();
        assert(wal.next_sequence() == 6);
        assert(wal.append(RecordType::Checkpoint, "", Value("mark")) == 6);

        std::vector<WalRecord> all = wal.read_all();
        assert(all.size() == 6);
        for (size_t i = 0; i < all.size(); ++i) {
            assert(all[i].seq == i + 1);
        }
        assert(all[2].node_id == "node-3");
        assert(*all[2].data.find("n") == Value(3));
        assert(all[5].type == RecordType::Checkpoint);
        assert(all[5].data == Value("mark"));
    }

    std::system("rm -f /tmp/fxd_test_seq.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_wal_read_from() {
    std::cout << "Testing WAL read_from cursor..." << std::endl;

    const std::string path = "/tmp/fxd_test_cursor.fxwal";
    std::system("rm -f /tmp/fxd_test_cursor.fxwal*");

    WriteAheadLog wal(path);
    for (int i = 1; i <= 5; ++i) {
        wal.append(RecordType::Signal, "n", Value(i));
    }

    std::vector<uint64_t> seen;
    WalScan scan = wal.read_from(3);
    for (const auto& record : scan) {
        seen.push_back(record.seq);
    }
    assert((seen == std::vector<uint64_t>{3, 4, 5}));

    // Independent scans restart from the beginning
    WalScan first = wal.read_from(0);
    WalScan second = wal.read_from(0);
    WalRecord a, b;
    assert(first.next(a) && a.seq == 1);
    assert(first.next(a) && a.seq == 2);
    assert(second.next(b) && b.seq == 1);

    // Appends after a scan starts are visible to it
    wal.append(RecordType::Signal, "n", Value(6));
    size_t rest = 0;
    while (first.next(a)) ++rest;
    assert(rest == 4);

    std::system("rm -f /tmp/fxd_test_cursor.fxwal*");
    std::cout << "  PASS" << std::endl;
}

static void write_three_records(const std::string& path) {
    WriteAheadLog wal(path);
    wal.append(RecordType::NodeCreate, "node-1", Value::map({{"v", 1}}));
    wal.append(RecordType::NodeCreate, "node-2", Value::map({{"v", 2}}));
    wal.append(RecordType::NodeCreate, "node-3", Value::map({{"v", 3}}));
}

// File offset of every record in an undamaged log
static std::vector<uint64_t> record_offsets(const std::string& path) {
    std::vector<uint64_t> offsets;
    WalScan scan(path, 0);
    for (;;) {
        ScanEntry entry = scan.next_entry();
        if (entry.status != ScanStatus::Ok) break;
        offsets.push_back(entry.offset);
    }
    return offsets;
}

void test_wal_checksum() {
    std::cout << "Testing WAL checksum detection..." << std::endl;

    const std::string path = "/tmp/fxd_test_crc.fxwal";
    std::system("rm -f /tmp/fxd_test_crc.fxwal*");

    {
        WriteAheadLog wal(path);
        wal.append(RecordType::NodeCreate, "node-1", Value::map({{"v", 1}}));
        wal.append(RecordType::NodeCreate, "node-2", Value::map({{"v", 2}}));
        wal.append(RecordType::NodeCreate, "node-3", Value::map({{"v", 3}}));
    }

    // Flip one byte inside the second record's node id
    std::vector<uint8_t> bytes = read_file(path);
    size_t at = find_bytes(bytes, "node-2");
    assert(at != std::string::npos);
    bytes[at + 5] ^= 0x01;
    write_file(path, bytes);

    {
        WalScan scan(path, 0);
        assert(scan.next_entry().status == ScanStatus::Ok);
        ScanEntry bad = scan.next_entry();
        assert(bad.status == ScanStatus::ChecksumMismatch);
        assert(bad.record.seq == 2);
        ScanEntry third = scan.next_entry();
        assert(third.status == ScanStatus::Ok);
        assert(third.record.node_id == "node-3");
        assert(scan.next_entry().status == ScanStatus::End);
    }

    {
        WriteAheadLog wal(path);
        std::vector<WalRecord> all = wal.read_all();
        assert(all.size() == 2);
        assert(all[0].seq == 1);
        assert(all[1].seq == 3);
        assert(wal.stats().record_count == 2);
        assert(wal.append(RecordType::NodePatch, "node-1", Value::map()) == 4);
    }

    // Header and payload bytes of the middle record: only it is skipped,
    // and opening the log leaves its neighbours on disk
    const size_t seq_byte = 0, ts_byte = 9, type_byte = 16;
    for (size_t field : {seq_byte, ts_byte, type_byte, size_t(0xFFFF)}) {
        std::system("rm -f /tmp/fxd_test_crc.fxwal*");
        write_three_records(path);
        std::vector<uint64_t> offsets = record_offsets(path);

        std::vector<uint8_t> damaged = read_file(path);
        // 0xFFFF: last payload byte, just before the checksum
        size_t pos = (field == 0xFFFF) ? offsets[2] - WAL_CHECKSUM_SIZE - 1 : offsets[1] + field;
        damaged[pos] ^= 0x02;
        write_file(path, damaged);

        WriteAheadLog wal(path);
        wal.open();
        assert(wal.stats().record_count == 2);
        assert(wal.last_sequence() == 3);
        assert(read_file(path).size() == damaged.size());

        std::vector<WalRecord> all = wal.read_all();
        assert(all.size() == 2);
        assert(all[0].node_id == "node-1");
        assert(all[1].node_id == "node-3");
    }

    std::system("rm -f /tmp/fxd_test_crc.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_wal_damaged_length() {
    std::cout << "Testing WAL damaged length field..." << std::endl;

    const std::string path = "/tmp/fxd_test_length.fxwal";
    std::system("rm -f /tmp/fxd_test_length.fxwal*");

    {
        WriteAheadLog wal(path);
        for (int i = 1; i <= 5; ++i) {
            wal.append(RecordType::NodeCreate, "n" + std::to_string(i), Value::map({{"i", i}}));
        }
    }
    std::vector<uint64_t> offsets = record_offsets(path);
    assert(offsets.size() == 5);

    // High byte of the second record's data length: the frame now claims
    // to run far past end of file
    std::vector<uint8_t> bytes = read_file(path);
    const size_t length_byte = offsets[1] + 22;
    bytes[length_byte] ^= 0x80;
    write_file(path, bytes);

    {
        WriteAheadLog wal(path);
        wal.open();
        assert(read_file(path).size() == bytes.size());
        assert(!file_exists(path + ".tail"));
        assert(wal.stats().record_count == 4);
        assert(wal.last_sequence() == 5);

        std::vector<WalRecord> all = wal.read_all();
        assert(all.size() == 4);
        assert(all[0].seq == 1);
        assert(all[1].seq == 3);
        assert(all[3].seq == 5);

        assert(wal.append(RecordType::NodePatch, "n1", Value::map()) == 6);
    }

    // Repairing the byte brings the record back; nothing was lost
    bytes = read_file(path);
    bytes[length_byte] ^= 0x80;
    write_file(path, bytes);
    {
        WalScan scan(path, 0);
        std::vector<uint64_t> seqs;
        for (const auto& record : scan) seqs.push_back(record.seq);
        assert((seqs == std::vector<uint64_t>{1, 2, 3, 4, 5, 6}));
        assert(scan.skipped() == 0);
    }

    // Node id length grown by one: the frame ends inside the next record
    bytes = read_file(path);
    bytes[offsets[1] + 17] ^= 0x01;
    write_file(path, bytes);
    {
        WriteAheadLog wal(path);
        wal.open();
        std::vector<WalRecord> all = wal.read_all();
        assert(all.size() == 5);
        assert(all[0].seq == 1);
        assert(all[1].seq == 3);
        assert(wal.last_sequence() == 6);
    }

    std::system("rm -f /tmp/fxd_test_length.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_wal_truncated_tail() {
    std::cout << "Testing WAL truncated tail recovery..." << std::endl;

    const std::string path = "/tmp/fxd_test_tail.fxwal";
    std::system("rm -f /tmp/fxd_test_tail.fxwal*");

    {
        WriteAheadLog wal(path);
        for (int i = 1; i <= 3; ++i) {
            wal.append(RecordType::NodeCreate, "n" + std::to_string(i), Value::map({{"i", i}}));
        }
    }

    // Simulate a torn final write
    std::vector<uint8_t> bytes = read_file(path);
    bytes.resize(bytes.size() - 5);
    write_file(path, bytes);

    {
        WalScan scan(path, 0);
        assert(scan.next_entry().status == ScanStatus::Ok);
        assert(scan.next_entry().status == ScanStatus::Ok);
        assert(scan.next_entry().status == ScanStatus::Truncated);
    }

    {
        WriteAheadLog wal(path);
        wal.open();
        // The torn bytes are kept beside the log
        std::vector<uint8_t> tail = read_file(path + ".tail");
        assert(!tail.empty());
        assert(read_file(path).size() + tail.size() == bytes.size());
        assert(wal.stats().record_count == 2);
        assert(wal.append(RecordType::NodeCreate, "n3", Value::map({{"i", 33}})) == 3);

        std::vector<WalRecord> all = wal.read_all();
        assert(all.size() == 3);
        assert(all[2].seq == 3);
        assert(*all[2].data.find("i") == Value(33));
    }

    std::system("rm -f /tmp/fxd_test_tail.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_wal_bad_header() {
    std::cout << "Testing WAL header validation..." << std::endl;

    const std::string path = "/tmp/fxd_test_magic.fxwal";
    std::system("rm -f /tmp/fxd_test_magic.fxwal*");

    write_file(path, std::vector<uint8_t>(64, 'x'));

    bool threw = false;
    try {
        WriteAheadLog wal(path);
        wal.open();
    } catch (const FormatError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        WalScan scan(path, 0);
    } catch (const FormatError&) {
        threw = true;
    }
    assert(threw);

    // Missing directory surfaces as an I/O error
    threw = false;
    try {
        WriteAheadLog wal("/tmp/fxd_no_such_dir/x.fxwal");
        wal.open();
    } catch (const IoError& e) {
        threw = true;
        assert(e.code().value() == ENOENT);
    }
    assert(threw);

    std::system("rm -f /tmp/fxd_test_magic.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_wal_compact_truncate() {
    std::cout << "Testing WAL compact and truncate..." << std::endl;

    const std::string path = "/tmp/fxd_test_compact.fxwal";
    std::system("rm -f /tmp/fxd_test_compact.fxwal*");

    WriteAheadLog wal(WalConfig{path, true, 4});
    for (int i = 0; i < 10; ++i) {
        wal.append(RecordType::NodePatch, "n", Value::map({{"i", i}}));
    }
    assert(wal.stats().record_count == 10);

    wal.compact([](WriteAheadLog& fresh) {
        fresh.append(RecordType::NodeCreate, "a", Value::map({{"x", 1}}));
        fresh.append(RecordType::NodeCreate, "b", Value::map({{"x", 2}}));
    });

    WalStats s = wal.stats();
    assert(s.record_count == 2);
    assert(s.oldest_seq == 1);
    assert(s.newest_seq == 2);
    assert(!file_exists(path + ".compact"));
    assert(wal.append(RecordType::NodeCreate, "c", Value::map()) == 3);

    // A throwing writer leaves the log untouched
    bool threw = false;
    try {
        wal.compact([](WriteAheadLog& fresh) {
            fresh.append(RecordType::NodeCreate, "z", Value::map());
            throw std::runtime_error("writer failed");
        });
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(wal.stats().record_count == 3);
    assert(!file_exists(path + ".compact"));

    wal.truncate();
    assert(wal.stats().record_count == 0);
    assert(wal.read_all().empty());
    assert(wal.append(RecordType::NodeCreate, "d", Value::map()) == 1);

    std::system("rm -f /tmp/fxd_test_compact.fxwal*");
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Disk
// ═══════════════════════════════════════════════════════════════════════════

void test_disk_wal_path() {
    std::cout << "Testing Disk log path mapping..." << std::endl;

    assert(Disk::wal_path_for("project.fxd") == "project.fxwal");
    assert(Disk::wal_path_for("/a/b/project.fxd") == "/a/b/project.fxwal");
    assert(Disk::wal_path_for("project") == "project.fxwal");
    assert(Disk::wal_path_for("project.db") == "project.db.fxwal");
    assert(Disk::wal_path_for("project.fxwal") == "project.fxwal");

    std::cout << "  PASS" << std::endl;
}

void test_disk_save_load() {
    std::cout << "Testing Disk save/load fidelity..." << std::endl;

    std::system("rm -f /tmp/fxd_test_disk.fxwal*");
    DiskConfig config{"/tmp/fxd_test_disk.fxd"};

    MemoryGraph source;
    build_sample(source);
    {
        SnippetIndex snippets;
        Disk disk(source, snippets, config);
        disk.open();
        assert(disk.wal_path() == "/tmp/fxd_test_disk.fxwal");
        assert(disk.save() == source.node_count());
        assert(disk.stats().records == 6);
    }

    // Record payload shape
    {
        WalScan scan("/tmp/fxd_test_disk.fxwal", 0);
        WalRecord root;
        assert(scan.next(root));
        assert(root.type == RecordType::NodeCreate);
        assert(root.data.find("parent_id")->is_null());
        assert(root.data.find("key_name")->is_null());
        assert(root.data.get_string("type") == "raw");
        assert(!root.data.contains("value"));

        WalRecord docs;
        assert(scan.next(docs));
        assert(docs.node_id == "docs-id");
        assert(docs.data.get_string("parent_id") == "root");
        assert(docs.data.get_string("key_name") == "docs");
        assert(docs.data.get_string("type") == "folder");

        WalRecord readme;
        assert(scan.next(readme));
        assert(*readme.data.find("proto") == Value::array({Value("text")}));
    }

    MemoryGraph target;
    target.ensure("__system", "sys-id");
    target.ensure("stale", "stale-id");
    SnippetIndex snippets;
    {
        Disk disk(target, snippets, config);
        LoadReport report = disk.load();
        assert(report.nodes == 6);
        assert(report.orphans == 0);
        assert(report.deferred == 0);
    }

    // Reserved roots survive, everything else is replaced
    assert(target.find("__system") != nullptr);
    assert(target.find("stale") == nullptr);
    assert(target.root().child("__system")->id() == "sys-id");

    MemoryGraph expected;
    expected.ensure("__system", "sys-id");
    build_sample(expected);
    // Reserved child was created first in both graphs, so order matches
    assert(same_tree(expected.root(), target.root()));

    assert(target.find("docs.readme.section")->value() == Value(3.5));
    assert(target.find("docs.readme")->proto() == std::optional<std::string>("text"));
    assert(snippets.find("snip-1") == std::optional<std::string>("code.snip"));

    std::system("rm -f /tmp/fxd_test_disk.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_disk_load_idempotent() {
    std::cout << "Testing Disk load idempotence..." << std::endl;

    std::system("rm -f /tmp/fxd_test_idem.fxwal*");
    DiskConfig config{"/tmp/fxd_test_idem.fxd"};

    MemoryGraph source;
    build_sample(source);
    {
        SnippetIndex snippets;
        Disk disk(source, snippets, config);
        disk.save();
        disk.patch("readme-id", Value("patched"));
    }

    MemoryGraph once;
    SnippetIndex once_snippets;
    Disk disk_once(once, once_snippets, config);
    disk_once.load();

    MemoryGraph twice;
    SnippetIndex twice_snippets;
    Disk disk_twice(twice, twice_snippets, config);
    disk_twice.load();
    LoadReport second = disk_twice.load();

    assert(second.nodes == 6);
    assert(second.patches == 1);
    assert(same_tree(once.root(), twice.root()));
    assert(once.node_count() == twice.node_count());
    assert(twice_snippets.size() == 1);

    std::system("rm -f /tmp/fxd_test_idem.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_disk_resave_clears_fields() {
    std::cout << "Testing Disk later save replaces node fields..." << std::endl;

    std::system("rm -f /tmp/fxd_test_resave.fxwal*");
    DiskConfig config{"/tmp/fxd_test_resave.fxd"};

    MemoryGraph source;
    build_sample(source);
    SnippetIndex source_snippets;
    {
        Disk disk(source, source_snippets, config);
        disk.save();

        MemoryNode* readme = source.find("docs.readme");
        readme->set_value(Value::undefined());
        readme->set_proto(std::nullopt);
        readme->set_meta(Value::undefined());
        source.find("docs")->set_meta(Value::undefined());
        source.find("code")->set_type("");
        disk.save();
    }

    MemoryGraph loaded;
    SnippetIndex snippets;
    Disk disk(loaded, snippets, config);
    LoadReport report = disk.load();
    assert(report.nodes == 12);

    const MemoryNode* readme = loaded.find("docs.readme");
    assert(readme->value().is_undefined());
    assert(!readme->proto());
    assert(readme->meta().is_undefined());
    assert(loaded.find("docs")->meta().is_undefined());
    assert(loaded.find("code")->type().empty());
    assert(same_tree(source.root(), loaded.root()));

    std::system("rm -f /tmp/fxd_test_resave.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_disk_load_leaves_log() {
    std::cout << "Testing Disk load leaves a damaged log untouched..." << std::endl;

    std::system("rm -f /tmp/fxd_test_loadro.fxwal*");
    const std::string path = "/tmp/fxd_test_loadro.fxwal";
    DiskConfig config{path};

    {
        MemoryGraph source;
        build_sample(source);
        SnippetIndex snippets;
        Disk disk(source, snippets, config);
        disk.save();
    }

    // Torn final record
    std::vector<uint8_t> bytes = read_file(path);
    bytes.resize(bytes.size() - 3);
    write_file(path, bytes);

    MemoryGraph loaded;
    SnippetIndex snippets;
    Disk disk(loaded, snippets, config);
    LoadReport report = disk.load();
    assert(report.nodes == 5);
    assert(loaded.find("code.snip") == nullptr);
    assert(read_file(path).size() == bytes.size());
    assert(!file_exists(path + ".tail"));

    std::system("rm -f /tmp/fxd_test_loadro.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_disk_out_of_order() {
    std::cout << "Testing Disk out-of-order parent resolution..." << std::endl;

    std::system("rm -f /tmp/fxd_test_order.fxwal*");

    MemoryGraph graph;
    SnippetIndex snippets;
    Disk disk(graph, snippets, DiskConfig{"/tmp/fxd_test_order.fxwal"});
    WriteAheadLog& wal = disk.wal();

    auto node = [](const char* id, Value parent, Value key) {
        return Value::map({{"id", id}, {"parent_id", std::move(parent)},
                           {"key_name", std::move(key)}, {"type", "raw"}});
    };

    wal.append(RecordType::NodeCreate, "root", node("root", Value(), Value()));
    Value c = node("c-id", "b-id", "c");
    c.set("value", 1);
    wal.append(RecordType::NodeCreate, "c-id", c);
    wal.append(RecordType::NodePatch, "c-id", Value::map({{"value", 2}}));
    wal.append(RecordType::NodeCreate, "b-id", node("b-id", "root", "b"));
    wal.append(RecordType::NodeCreate, "d-id", node("d-id", "missing-id", "d"));
    wal.append(RecordType::NodePatch, "ghost", Value::map({{"value", 9}}));
    wal.append(RecordType::LinkAdd, "b-id", Value::map({{"to", "d-id"}}));

    LoadReport report = disk.load();
    assert(report.nodes == 4);
    assert(report.deferred == 2);
    assert(report.orphans == 1);
    assert(report.patches == 1);
    assert(report.dropped_patches == 1);
    assert(report.skipped == 1);

    MemoryNode* child = graph.find("b.c");
    assert(child != nullptr);
    assert(child->id() == "c-id");
    assert(child->value() == Value(2));
    assert(graph.find("b")->id() == "b-id");

    // Orphan degrades to its bare key under the root
    assert(graph.find("d") != nullptr);
    assert(graph.find("d")->id() == "d-id");

    std::system("rm -f /tmp/fxd_test_order.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_disk_patch() {
    std::cout << "Testing Disk incremental patches..." << std::endl;

    std::system("rm -f /tmp/fxd_test_patch.fxwal*");
    DiskConfig config{"/tmp/fxd_test_patch.fxd"};

    MemoryGraph source;
    build_sample(source);
    SnippetIndex snippets;
    Disk disk(source, snippets, config);
    disk.save();

    disk.patch("docs-id", std::nullopt, Value::map({{"size", 10}}));
    disk.patch("readme-id", Value::map({{"title", "Readme"}}));
    disk.patch("snip-id", std::nullopt, Value::map({{"id", "snip-2"}}));

    MemoryGraph target;
    SnippetIndex target_snippets;
    Disk loader(target, target_snippets, config);
    LoadReport report = loader.load();
    assert(report.patches == 3);

    // Meta is shallow-merged
    const Value& meta = target.find("docs")->meta();
    assert(meta.get_string("color") == "blue");
    assert(*meta.find("size") == Value(10));

    // Value is replaced
    assert(target.find("docs.readme")->value().get_string("title") == "Readme");

    // Both snippet ids point at the node; the newest was indexed last
    assert(target_snippets.find("snip-2") == std::optional<std::string>("code.snip"));
    assert(target.find("code.snip")->meta().get_string("lang") == "ts");

    std::system("rm -f /tmp/fxd_test_patch.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_disk_compact() {
    std::cout << "Testing Disk compaction..." << std::endl;

    std::system("rm -f /tmp/fxd_test_dcompact.fxwal*");
    DiskConfig config{"/tmp/fxd_test_dcompact.fxd"};

    MemoryGraph graph;
    build_sample(graph);
    SnippetIndex snippets;
    Disk disk(graph, snippets, config);

    disk.save();
    graph.find("docs.readme")->set_value("v2");
    disk.save();
    disk.patch("section-id", Value(7.5));
    graph.find("docs.readme.section")->set_value(7.5);
    assert(disk.stats().records == 13);

    size_t written = disk.compact();
    assert(written == graph.node_count());
    DiskStats s = disk.stats();
    assert(s.records == graph.node_count());
    assert(s.nodes == graph.node_count());

    MemoryGraph reloaded;
    SnippetIndex reloaded_snippets;
    Disk loader(reloaded, reloaded_snippets, config);
    loader.load();
    assert(same_tree(graph.root(), reloaded.root()));
    assert(reloaded.find("docs.readme")->value() == Value("v2"));

    // Appends continue after compaction
    assert(disk.patch("docs-id", Value(1)) == s.records + 1);

    std::system("rm -f /tmp/fxd_test_dcompact.fxwal*");
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Signals
// ═══════════════════════════════════════════════════════════════════════════

static SignalInput value_signal(const std::string& node, int v) {
    SignalInput in;
    in.source_node_id = node;
    in.base_version = static_cast<uint64_t>(v);
    in.new_version = static_cast<uint64_t>(v + 1);
    in.delta = ValueDelta{Value(v), Value(v + 1)};
    return in;
}

void test_signal_replay_order() {
    std::cout << "Testing Signal replay and live order..." << std::endl;

    SignalStream stream;
    for (int i = 0; i < 5; ++i) {
        SignalRecord r = stream.append(value_signal("n", i));
        assert(r.seq == static_cast<uint64_t>(i));
    }
    assert(stream.cursor() == 5);

    std::vector<uint64_t> seen;
    SubscribeOptions options;
    Unsubscribe unsub = stream.subscribe(options, [&](const SignalRecord& s) {
        seen.push_back(s.seq);
    });
    assert((seen == std::vector<uint64_t>{0, 1, 2, 3, 4}));

    stream.append(value_signal("n", 5));
    assert(seen.size() == 6 && seen.back() == 5);
    stream.append(value_signal("n", 6));
    assert(seen.size() == 7 && seen.back() == 6);

    // Small batches deliver the same sequence
    std::vector<uint64_t> batched;
    SubscribeOptions small;
    small.batch_size = 2;
    small.cursor = 1;
    stream.subscribe(small, [&](const SignalRecord& s) { batched.push_back(s.seq); });
    assert((batched == std::vector<uint64_t>{1, 2, 3, 4, 5, 6}));

    unsub();
    stream.append(value_signal("n", 7));
    assert(seen.size() == 7);
    assert(batched.size() == 7);

    std::cout << "  PASS" << std::endl;
}

void test_signal_filters_and_tail() {
    std::cout << "Testing Signal filters and tail..." << std::endl;

    SignalStream stream;
    SignalEmitter emit(stream);
    emit.emit_value("a", 1, 2, 0, 1);
    emit.emit_child_add("b", "k", "c-1", 0, 1);

    std::vector<uint64_t> tailed;
    stream.tail([&](const SignalRecord& s) { tailed.push_back(s.seq); });
    assert(tailed.empty());

    std::vector<uint64_t> children;
    stream.tail(SignalKind::Children, [&](const SignalRecord& s) { children.push_back(s.seq); });

    std::vector<uint64_t> from_a;
    SubscribeOptions only_a;
    only_a.node_id = "a";
    stream.subscribe(only_a, [&](const SignalRecord& s) { from_a.push_back(s.seq); });
    assert((from_a == std::vector<uint64_t>{0}));

    emit.emit_metadata("a", "color", "red", "blue", 1, 2);
    emit.emit_child_remove("b", "k", "c-1", 1, 2);
    emit.emit_custom("c", "saved", Value::map({{"ok", true}}), 0, 0);

    assert((tailed == std::vector<uint64_t>{2, 3, 4}));
    assert((children == std::vector<uint64_t>{3}));
    assert((from_a == std::vector<uint64_t>{0, 2}));

    std::vector<SignalRecord> range = stream.read_range(1, 100);
    assert(range.size() == 4);
    assert(range[0].seq == 1);
    assert(stream.read_range(3, 2).empty());
    std::vector<SignalRecord> all = stream.read_all();
    assert(all.size() == 5);

    const auto& md = std::get<MetadataDelta>(all[2].delta);
    assert(md.key == "color");
    assert(md.new_value == Value("blue"));

    SignalStats stats = stream.stats();
    assert(stats.total_signals == 5);
    assert(stats.subscribers == 3);
    assert(stats.max_append_us >= stats.avg_append_us);

    stream.clear();
    assert(stream.cursor() == 0);
    SignalRecord fresh = emit.emit_value("a", 0, 1, 0, 1);
    assert(fresh.seq == 0);
    assert(tailed.back() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_signal_reentrant_append() {
    std::cout << "Testing Signal reentrant append ordering..." << std::endl;

    SignalStream stream;
    std::vector<uint64_t> first, second;
    bool appended = false;

    stream.subscribe(SubscribeOptions{}, [&](const SignalRecord& s) {
        first.push_back(s.seq);
        if (!appended) {
            appended = true;
            stream.append(value_signal("inner", 100));
            stream.append(value_signal("inner", 101));
        }
    });
    stream.subscribe(SubscribeOptions{}, [&](const SignalRecord& s) {
        second.push_back(s.seq);
    });

    stream.append(value_signal("outer", 0));
    stream.append(value_signal("outer", 1));

    std::vector<uint64_t> expected{0, 1, 2, 3};
    assert(first == expected);
    assert(second == expected);

    // Replay from inside a callback during history delivery
    std::vector<uint64_t> third;
    bool nested = false;
    stream.subscribe(SubscribeOptions{}, [&](const SignalRecord& s) {
        third.push_back(s.seq);
        if (s.seq == 1 && !nested) {
            nested = true;
            stream.append(value_signal("nested", 5));
        }
    });
    assert((third == std::vector<uint64_t>{0, 1, 2, 3, 4}));
    assert(first.size() == 5 && second.size() == 5);

    std::cout << "  PASS" << std::endl;
}

void test_signal_subscriber_errors() {
    std::cout << "Testing Signal subscriber error isolation..." << std::endl;

    SignalStream stream;
    size_t good_calls = 0;
    size_t bad_calls = 0;

    stream.tail([&](const SignalRecord&) {
        ++bad_calls;
        throw std::runtime_error("subscriber failure");
    });
    Unsubscribe unsub = stream.tail([&](const SignalRecord&) { ++good_calls; });

    SignalRecord r = stream.append(value_signal("n", 0));
    assert(r.seq == 0);
    assert(bad_calls == 1);
    assert(good_calls == 1);

    stream.append(value_signal("n", 1));
    assert(good_calls == 2);

    // Unsubscribe from inside delivery takes effect at once
    size_t self_removing = 0;
    Unsubscribe self;
    self = stream.tail([&](const SignalRecord&) {
        ++self_removing;
        self();
    });
    stream.append(value_signal("n", 2));
    stream.append(value_signal("n", 3));
    assert(self_removing == 1);

    unsub();
    stream.append(value_signal("n", 4));
    assert(good_calls == 4);
    assert(stream.stats().subscribers == 1);

    std::cout << "  PASS" << std::endl;
}

void test_signal_kind_from_delta() {
    std::cout << "Testing Signal kind follows delta..." << std::endl;

    const std::string path = "/tmp/fxd_test_signal_kind.fxwal";
    std::system("rm -f /tmp/fxd_test_signal_kind.fxwal*");

    {
        WriteAheadLog wal(path);
        WalSignalBackend backend(wal);
        SignalStream stream(&backend);

        size_t custom_calls = 0;
        size_t value_calls = 0;
        Unsubscribe custom = stream.tail(SignalKind::Custom, [&](const SignalRecord&) { ++custom_calls; });
        Unsubscribe values = stream.tail(SignalKind::Value, [&](const SignalRecord&) { ++value_calls; });

        SignalInput in;
        in.source_node_id = "n";
        in.delta = CustomDelta{"ping", Value(1)};
        SignalRecord r = stream.append(in);
        assert(r.kind == SignalKind::Custom);
        assert(custom_calls == 1);
        assert(value_calls == 0);

        SignalInput md;
        md.source_node_id = "n";
        md.delta = MetadataDelta{"k", Value(), Value("v")};
        assert(stream.append(md).kind == SignalKind::Metadata);

        std::vector<SignalRecord> stored = backend.read(0, 10);
        assert(stored.size() == 2);
        assert(stored[0].kind == SignalKind::Custom);
        assert(std::get<CustomDelta>(stored[0].delta).event == "ping");
        assert(stored[1].kind == SignalKind::Metadata);
        assert(std::get<MetadataDelta>(stored[1].delta).new_value == Value("v"));
    }

    std::system("rm -f /tmp/fxd_test_signal_kind.fxwal*");
    std::cout << "  PASS" << std::endl;
}

void test_signal_wal_backend() {
    std::cout << "Testing Signal durable backend..." << std::endl;

    const std::string path = "/tmp/fxd_test_signals.fxwal";
    std::system("rm -f /tmp/fxd_test_signals.fxwal*");

    {
        WriteAheadLog wal(path);
        WalSignalBackend backend(wal);
        SignalStream stream(&backend);
        SignalEmitter emit(stream);

        emit.emit_value("n1", 1, 2, 0, 1);
        emit.emit_child_move("n1", "slot", "c-new", "c-old", 1, 2);
        emit.emit_metadata("n1", "tag", Value(), "x", 2, 3);
        emit.emit_custom("n2", "ping", Value::array({Value(1), Value(2)}), 0, 0);

        // A node record sharing the log survives signal compaction
        wal.append(RecordType::NodeCreate, "n1", Value::map({{"id", "n1"}}));

        std::vector<SignalRecord> all = backend.read(0, 100);
        assert(all.size() == 4);
        assert(all[0].kind == SignalKind::Value);
        assert(std::get<ValueDelta>(all[0].delta).new_value == Value(2));

        const auto& moved = std::get<ChildrenDelta>(all[1].delta);
        assert(moved.op == ChildOp::Move);
        assert(moved.key == "slot");
        assert(moved.child_id == std::optional<std::string>("c-new"));
        assert(moved.old_child_id == std::optional<std::string>("c-old"));
        assert(all[1].base_version == 1 && all[1].new_version == 2);

        assert(std::get<CustomDelta>(all[3].delta).event == "ping");
        assert(all[3].source_node_id == "n2");
        assert(all[3].timestamp == stream.read_all()[3].timestamp);

        backend.compact(2);
        std::vector<SignalRecord> kept = backend.read(0, 100);
        assert(kept.size() == 2);
        assert(kept[0].seq == 2);
        assert(kept[1].seq == 3);
        assert(wal.stats().record_count == 3);
    }

    // In-memory backend has the same contract
    MemorySignalBackend memory;
    SignalStream stream(&memory);
    for (int i = 0; i < 4; ++i) stream.append(value_signal("m", i));
    assert(memory.read(1, 3).size() == 2);
    memory.compact(3);
    assert(memory.size() == 1);

    // Malformed payloads are rejected
    bool threw = false;
    try {
        signal_from_value(Value::map({{"seq", 1}}));
    } catch (const FormatError&) {
        threw = true;
    }
    assert(threw);

    std::system("rm -f /tmp/fxd_test_signals.fxwal*");
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Config
// ═══════════════════════════════════════════════════════════════════════════

void test_config() {
    std::cout << "Testing config loading..." << std::endl;

    json j = {
        {"disk", {{"path", "/tmp/project.fxd"}, {"compact_threshold", 50}}},
        {"signals", {{"batch_size", 7}, {"wal_path", "/tmp/signals.fxwal"}, {"sync_on_write", true}}},
    };
    FxdConfig config = config_from_json(j);
    assert(config.signals.wal_path == "/tmp/signals.fxwal");
    assert(config.signals.sync_on_write);
    assert(config.disk.path == "/tmp/project.fxd");
    assert(config.disk.compact_threshold == 50);
    assert(!config.disk.sync_on_write);
    assert(config.signals.batch_size == 7);

    FxdConfig again = config_from_json(config_to_json(config));
    assert(again.disk.path == config.disk.path);
    assert(again.signals.batch_size == 7);
    assert(again.signals.wal_path == config.signals.wal_path);

    bool threw = false;
    try {
        config_from_json(json{{"disk", {{"compact_threshold", "lots"}}}});
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    const std::string path = "/tmp/fxd_test_config.json";
    {
        std::ofstream out(path);
        out << "{\"disk\": {\"path\": \"x.fxd\"}}";
    }
    assert(load_config(path).disk.path == "x.fxd");

    {
        std::ofstream out(path);
        out << "{\"disk\": ";
    }
    threw = false;
    try {
        load_config(path);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        load_config("/tmp/fxd_no_such_config.json");
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::system("rm -f /tmp/fxd_test_config.json");
    std::cout << "  PASS" << std::endl;
}

void test_signal_log_from_config() {
    std::cout << "Testing signal log built from config..." << std::endl;

    const std::string wal_path = "/tmp/fxd_test_signal_log.fxwal";
    std::system("rm -f /tmp/fxd_test_signal_log.fxwal*");

    FxdConfig config = config_from_json(json{
        {"signals", {{"batch_size", 3}, {"wal_path", wal_path}, {"sync_on_write", true}}},
    });

    {
        SignalLog log(config.signals);
        assert(log.durable());
        assert(log.wal()->config().sync_on_write);
        assert(log.wal()->path() == wal_path);

        SignalEmitter emit(log.stream());
        emit.emit_value("n", 1, 2, 0, 1);
        emit.emit_custom("n", "ping", Value(), 1, 1);
        assert(log.wal()->stats().record_count == 2);
    }

    {
        WalScan scan(wal_path, 0);
        std::vector<SignalRecord> stored;
        for (const auto& record : scan) {
            assert(record.type == RecordType::Signal);
            stored.push_back(signal_from_value(record.data));
        }
        assert(stored.size() == 2);
        assert(stored[1].kind == SignalKind::Custom);
    }

    SignalLog memory(config_from_json(json::object()).signals);
    assert(!memory.durable());
    assert(memory.wal() == nullptr);
    memory.stream().append(value_signal("m", 0));
    assert(memory.backend().read(0, 10).size() == 1);

    std::system("rm -f /tmp/fxd_test_signal_log.fxwal*");
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== fxd Tests ===" << std::endl;
    std::cout << "fxd " << FXD_VERSION << std::endl;
    std::cout << std::endl;

    test_crc32();
    test_value_equality();
    test_value_json();
    test_uarr_roundtrip();
    test_uarr_narrowest_width();
    test_uarr_field_order();
    test_uarr_value_wrapping();
    test_uarr_reader_access();
    test_uarr_format_errors();

    std::cout << std::endl;
    std::cout << "=== WAL Tests ===" << std::endl;
    test_wal_sequence();
    test_wal_read_from();
    test_wal_checksum();
    test_wal_damaged_length();
    test_wal_truncated_tail();
    test_wal_bad_header();
    test_wal_compact_truncate();

    std::cout << std::endl;
    std::cout << "=== Disk Tests ===" << std::endl;
    test_disk_wal_path();
    test_disk_save_load();
    test_disk_load_idempotent();
    test_disk_resave_clears_fields();
    test_disk_load_leaves_log();
    test_disk_out_of_order();
    test_disk_patch();
    test_disk_compact();

    std::cout << std::endl;
    std::cout << "=== Signal Tests ===" << std::endl;
    test_signal_replay_order();
    test_signal_filters_and_tail();
    test_signal_reentrant_append();
    test_signal_subscriber_errors();
    test_signal_kind_from_delta();
    test_signal_wal_backend();

    std::cout << std::endl;
    test_config();
    test_signal_log_from_config();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
