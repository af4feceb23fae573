#include "pltx/core/errors.hpp"
#include "pltx/core/signal_catalog.hpp"
#include "pltx_test_utils.hpp"

#include "gtest/gtest.h"

#include <thread>

namespace pltx {

class SignalCatalogTest : public testing::Test {
public:
  std::shared_ptr<PltxReader> open_with(const std::vector<std::string> &names) {
    test::PltxFileBuilder b;
    for (const auto &name : names) {
      uint32_t id = b.add_signal(name);
      b.add_chunk(id, {{0.0, static_cast<double>(id)}});
    }
    std::string file = "f" + std::to_string(files_++) + ".pltx";
    return PltxReader::open(dir_.write(file, b.build()));
  }

  test::TempDir dir_;
  int files_ = 0;
};

TEST_F(SignalCatalogTest, SuffixesInOpenOrder) {
  SignalCatalog catalog;
  auto a = open_with({"Voltage", "Current"});
  auto b = open_with({"Voltage"});
  auto c = open_with({"Voltage", "Current"});

  auto ra = catalog.register_reader(a);
  auto rb = catalog.register_reader(b);
  auto rc = catalog.register_reader(c);

  ASSERT_EQ((std::vector<std::string>{"Voltage", "Current"}), ra.public_names);
  ASSERT_EQ((std::vector<std::string>{"Voltage_1"}), rb.public_names);
  ASSERT_EQ((std::vector<std::string>{"Voltage_2", "Current_1"}),
            rc.public_names);

  ASSERT_EQ(a, catalog.resolve("Voltage").reader);
  ASSERT_EQ(b, catalog.resolve("Voltage_1").reader);
  ASSERT_EQ(c, catalog.resolve("Voltage_2").reader);
  ASSERT_EQ("Voltage", catalog.resolve("Voltage_2").internal_name);
  ASSERT_EQ(rc.reader_id, catalog.resolve("Current_1").reader_id);
  ASSERT_EQ(5u, catalog.size());
  ASSERT_EQ((std::vector<std::string>{"Voltage", "Current", "Voltage_1",
                                      "Voltage_2", "Current_1"}),
            catalog.public_names());
}

TEST_F(SignalCatalogTest, FirstUnusedSuffix) {
  SignalCatalog catalog;
  catalog.register_reader(open_with({"Voltage_1", "Voltage"}));
  auto r = catalog.register_reader(open_with({"Voltage"}));
  ASSERT_EQ((std::vector<std::string>{"Voltage_2"}), r.public_names);
}

TEST_F(SignalCatalogTest, DuplicatesInsideOneFile) {
  SignalCatalog catalog;
  auto r = catalog.register_reader(open_with({"Temp", "Temp"}));
  ASSERT_EQ((std::vector<std::string>{"Temp", "Temp_1"}), r.public_names);
  ASSERT_EQ(0u, catalog.resolve("Temp").signal_id);
  ASSERT_EQ(1u, catalog.resolve("Temp_1").signal_id);
}

TEST_F(SignalCatalogTest, ExactMatchOnly) {
  SignalCatalog catalog;
  catalog.register_reader(open_with({"Voltage"}));
  EXPECT_THROW(catalog.resolve("Volt"), LookupError);
  EXPECT_THROW(catalog.resolve("voltage"), LookupError);
  EXPECT_THROW(catalog.resolve("Voltage_1"), LookupError);
  EXPECT_FALSE(catalog.find("Volt").has_value());
  EXPECT_TRUE(catalog.contains("Voltage"));
}

TEST_F(SignalCatalogTest, NamesStayReservedAfterClose) {
  SignalCatalog catalog;
  auto ra = catalog.register_reader(open_with({"Voltage"}));
  catalog.register_reader(open_with({"Voltage"}));

  ASSERT_TRUE(catalog.unregister_reader(ra.reader_id));
  ASSERT_FALSE(catalog.unregister_reader(ra.reader_id));
  EXPECT_THROW(catalog.resolve("Voltage"), LookupError);
  ASSERT_TRUE(catalog.contains("Voltage_1"));

  auto rc = catalog.register_reader(open_with({"Voltage"}));
  ASSERT_EQ((std::vector<std::string>{"Voltage_2"}), rc.public_names);
  ASSERT_EQ((std::vector<std::string>{"Voltage_1", "Voltage_2"}),
            catalog.public_names());
}

TEST_F(SignalCatalogTest, ReaderSummaries) {
  SignalCatalog catalog;
  auto r1 = catalog.register_reader(open_with({"b", "a", "b"}));
  auto r2 = catalog.register_reader(open_with({"c"}));

  auto readers = catalog.list_readers();
  ASSERT_EQ(2u, readers.size());
  ASSERT_EQ(r1.reader_id, readers[0].reader_id);
  ASSERT_EQ(r2.reader_id, readers[1].reader_id);
  ASSERT_NE(r1.reader_id, r2.reader_id);

  auto summary = catalog.reader_summary(r1.reader_id);
  ASSERT_EQ((std::vector<std::string>{"a", "b"}), summary.headers);
  ASSERT_EQ(2u, summary.signals_count);
  ASSERT_EQ(dir_.path("f0.pltx"), summary.path);

  EXPECT_THROW(catalog.reader_summary("nope"), LookupError);
}

TEST_F(SignalCatalogTest, ConcurrentRegistrationAssignsDistinctNames) {
  SignalCatalog catalog;
  std::vector<std::shared_ptr<PltxReader>> readers;
  for (int i = 0; i < 8; i++)
    readers.push_back(open_with({"Voltage", "Current"}));

  std::vector<std::thread> threads;
  for (auto &r : readers)
    threads.emplace_back([&catalog, r]() { catalog.register_reader(r); });
  for (auto &th : threads)
    th.join();

  ASSERT_EQ(16u, catalog.size());
  ASSERT_TRUE(catalog.contains("Voltage"));
  for (int i = 1; i < 8; i++) {
    ASSERT_TRUE(catalog.contains("Voltage_" + std::to_string(i)));
    ASSERT_TRUE(catalog.contains("Current_" + std::to_string(i)));
  }
}

} // namespace pltx
