// see LICENSE.md for license.
#include "test_util.hpp"

using namespace zerocompress;

static dictionary_t::corpus_t
corpus_of(const char *const *items, const size_t count)
{
    dictionary_t::corpus_t corpus;
    for (size_t i = 0; i < count; ++i) corpus.push_back(from_hex(items[i]));
    return corpus;
}

static uint_fast32_t
index_of(const dictionary_t &dictionary, const char *pattern)
{
    const bytes_t bytes = from_hex(pattern);
    uint_fast32_t index = 0xFFFFFFFF;
    EXPECT_TRUE(dictionary.lookup(bytes.data(), bytes.size(), &index)) << pattern;
    return index;
}

TEST(dictionary, most_frequent_first) {
    const char *items[] = { "bb", "aa", "bb", "cc", "aa", "bb" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 6), 256, 1);
    ASSERT_TRUE(dictionary.get() != NULL);
    EXPECT_EQ(3u, dictionary->size());
    EXPECT_EQ(0u, index_of(*dictionary, "bb"));
    EXPECT_EQ(1u, index_of(*dictionary, "aa"));
    EXPECT_EQ(2u, index_of(*dictionary, "cc"));
    EXPECT_EQ(0u, dictionary->dropped());
}

TEST(dictionary, ties_keep_first_appearance) {
    const char *items[] = { "10", "20", "20", "10", "30", "40" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 6), 256, 1);
    ASSERT_TRUE(dictionary.get() != NULL);
    EXPECT_EQ(0u, index_of(*dictionary, "10"));
    EXPECT_EQ(1u, index_of(*dictionary, "20"));
    EXPECT_EQ(2u, index_of(*dictionary, "30"));
    EXPECT_EQ(3u, index_of(*dictionary, "40"));
}

TEST(dictionary, build_is_stable) {
    const char *items[] = { "0102", "0304", "0102", "05", "0304", "06" };
    dictionary_ptr_t first = dictionary_t::build(corpus_of(items, 6), 256, 1);
    dictionary_ptr_t second = dictionary_t::build(corpus_of(items, 6), 256, 1);
    bytes_t a, b;
    first->save(a);
    second->save(b);
    EXPECT_EQ(a, b);
}

TEST(dictionary, capacity_drops_least_frequent) {
    const char *items[] = { "01", "02", "02", "03", "03", "03" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 6), 2, 1);
    ASSERT_TRUE(dictionary.get() != NULL);
    EXPECT_EQ(2u, dictionary->size());
    EXPECT_EQ(1u, dictionary->dropped());
    EXPECT_EQ(0u, index_of(*dictionary, "03"));
    EXPECT_EQ(1u, index_of(*dictionary, "02"));
    const bytes_t missing = from_hex("01");
    uint_fast32_t index;
    EXPECT_FALSE(dictionary->lookup(missing.data(), missing.size(), &index));
}

TEST(dictionary, capacity_clamped_to_index_width) {
    dictionary_t::corpus_t corpus;
    for (unsigned i = 0; i < 300; ++i) {
        bytes_t pattern;
        write_big_endian(pattern, i, 2);
        corpus.push_back(pattern);
    }
    dictionary_ptr_t dictionary = dictionary_t::build(corpus, 100000, 1);
    ASSERT_TRUE(dictionary.get() != NULL);
    EXPECT_EQ(256u, dictionary->get_capacity());
    EXPECT_EQ(256u, dictionary->size());
    EXPECT_EQ(44u, dictionary->dropped());
}

TEST(dictionary, rejects_index_width) {
    dictionary_t::corpus_t corpus(1, from_hex("01"));
    EXPECT_TRUE(dictionary_t::build(corpus, 16, 0).get() == NULL);
    EXPECT_TRUE(dictionary_t::build(corpus, 16, 3).get() == NULL);
}

TEST(dictionary, min_count_filters) {
    const char *items[] = { "01", "02", "02", "03", "03", "03" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 6), 256, 1, 2);
    ASSERT_TRUE(dictionary.get() != NULL);
    EXPECT_EQ(2u, dictionary->size());
    EXPECT_EQ(0u, dictionary->dropped());
}

TEST(dictionary, reverse_lookup) {
    const char *items[] = { "aabb", "cc" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 2), 256, 1);
    ASSERT_TRUE(dictionary->reverse(0) != NULL);
    EXPECT_EQ(from_hex("aabb"), *dictionary->reverse(0));
    EXPECT_EQ(from_hex("cc"), *dictionary->reverse(1));
    EXPECT_TRUE(dictionary->reverse(2) == NULL);
    EXPECT_EQ(1u, dictionary->shortest());
    EXPECT_EQ(2u, dictionary->longest());
}

TEST(dictionary, candidates_longest_then_lowest_index) {
    const char *items[] = { "aa", "aabb", "aabbcc", "ab01", "bb" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 5), 256, 1);
    const std::vector<uint32_t> &candidates = dictionary->candidates(0xAA);
    ASSERT_EQ(3u, candidates.size());
    EXPECT_EQ(2u, candidates[0]);
    EXPECT_EQ(1u, candidates[1]);
    EXPECT_EQ(0u, candidates[2]);
    EXPECT_EQ(1u, dictionary->candidates(0xAB).size());
    EXPECT_TRUE(dictionary->candidates(0x00).empty());
}

TEST(dictionary, save_and_load) {
    const char *items[] = { "a9059cbb", "095ea7b3", "a9059cbb", "23b872dd" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 4), 1000, 2);
    bytes_t record;
    dictionary->save(record);
    EXPECT_EQ(0x5A, record[0]);
    EXPECT_EQ(0x43, record[1]);
    EXPECT_EQ(0x44, record[2]);
    EXPECT_EQ(0x31, record[3]);

    location_t in;
    dictionary_ptr_t loaded;
    in.encapsulate(record.data(), record.size());
    ASSERT_EQ(state_ok, dictionary_t::load(&in, loaded));
    EXPECT_EQ(0u, (unsigned)in.available_bytes);
    EXPECT_EQ(dictionary->size(), loaded->size());
    EXPECT_EQ(1000u, loaded->get_capacity());
    EXPECT_EQ(2u, loaded->get_index_width());
    EXPECT_EQ(0u, index_of(*loaded, "a9059cbb"));
    EXPECT_EQ(1u, index_of(*loaded, "095ea7b3"));
    EXPECT_EQ(2u, index_of(*loaded, "23b872dd"));
}

TEST(dictionary, load_rejects_malformed_records) {
    const char *items[] = { "01", "0203" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 2), 256, 1);
    bytes_t record;
    dictionary->save(record);

    std::vector<bytes_t> bad;
    bad.push_back(bytes_t(record.begin(), record.begin() + 3));
    bad.push_back(bytes_t(record.begin(), record.end() - 1));
    bad.push_back(record);
    bad.back()[0] = 0x00;                 // magic
    bad.push_back(record);
    bad.back()[8] = 3;                    // index width
    bad.push_back(record);
    bad.back()[12] = 3;                   // count above the entries present
    bad.push_back(record);
    bad.back()[17] = 0;                   // second entry reuses index 0
    bad.push_back(record);
    bad.back()[15] = 0;                   // empty pattern
    bad.back()[14] = 0;
    for (size_t i = 0; i < bad.size(); ++i) {
        location_t in;
        dictionary_ptr_t loaded;
        in.encapsulate(bad[i].data(), bad[i].size());
        EXPECT_NE(state_ok, dictionary_t::load(&in, loaded)) << i;
        EXPECT_TRUE(loaded.get() == NULL) << i;
    }
}

TEST(dictionary, write_and_read_file) {
    const char *items[] = { "00112233", "44556677", "8899" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 3), 256, 1);
    FILE *fp = tmpfile();
    ASSERT_TRUE(fp != NULL);
    ASSERT_TRUE(dictionary->write(fp));
    rewind(fp);
    dictionary_ptr_t loaded;
    EXPECT_EQ(state_ok, dictionary_t::read(fp, loaded));
    fclose(fp);
    ASSERT_TRUE(loaded.get() != NULL);
    EXPECT_EQ(3u, loaded->size());
    EXPECT_EQ(2u, index_of(*loaded, "8899"));
}

TEST(dictionary, read_truncated_file) {
    FILE *fp = tmpfile();
    ASSERT_TRUE(fp != NULL);
    fputs("ZCD1", fp);
    rewind(fp);
    dictionary_ptr_t loaded;
    EXPECT_EQ(state_error_invalid_input, dictionary_t::read(fp, loaded));
    fclose(fp);
}

TEST(dictionary_set, publish_replaces_snapshot) {
    dictionary_set_t dictionaries;
    EXPECT_TRUE(dictionaries.snapshot().get(stage_pattern) == NULL);
    const char *items[] = { "01020304" };
    dictionary_ptr_t dictionary = dictionary_t::build(corpus_of(items, 1), 256, 1);
    dictionary_set_t::snapshot_t before = dictionaries.snapshot();
    dictionaries.publish(stage_pattern, dictionary);
    EXPECT_TRUE(before.get(stage_pattern) == NULL);
    EXPECT_EQ(dictionary.get(), dictionaries.snapshot().get(stage_pattern));
    EXPECT_TRUE(dictionaries.snapshot().get(stage_zero_run) == NULL);
}

TEST(dictionary, build_records_dropped_entries) {
    const char *items[] = { "01", "02", "02", "03", "03", "03" };
    statistics_t statistics;
    dictionary_ptr_t dictionary =
        dictionary_t::build(corpus_of(items, 6), 2, 1, 1, &statistics, stage_address);
    ASSERT_TRUE(dictionary.get() != NULL);
    EXPECT_EQ(1u, statistics.get_stage(stage_address).dictionary_dropped);
    EXPECT_EQ(2u, statistics.get_stage(stage_address).dictionary_size);
    EXPECT_EQ(0u, statistics.get_stage(stage_pattern).dictionary_dropped);

    dictionary_t::build(corpus_of(items, 6), 1, 1, 1, &statistics, stage_address);
    EXPECT_EQ(3u, statistics.get_stage(stage_address).dictionary_dropped);
    EXPECT_EQ(1u, statistics.get_stage(stage_address).dictionary_size);
}
