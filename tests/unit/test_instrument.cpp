#include "TestFixtures.hpp"
#include "pl-gpib/Errors.hpp"
#include "pl-gpib/adapter/GenericInstrument.hpp"

#include <gtest/gtest.h>

using namespace plgpib;
using namespace plgpib::test;

using Lines = std::vector<std::string>;

class InstrumentTest : public AdapterTest {
protected:
  void SetUp() override {
    AdapterTest::SetUp();
    controller_->set_auto_read(true);
    transport_->clear_history();
  }
};

TEST(InstrumentStandaloneTest, IOBeforeAttachFails) {
  GenericInstrument instrument(12);

  EXPECT_FALSE(instrument.is_attached());
  EXPECT_EQ(instrument.name(), "GPIB12");
  EXPECT_THROW(instrument.write("*RST"), NotAttached);
  EXPECT_THROW(instrument.read(), NotAttached);
  EXPECT_THROW(instrument.query("ident"), NotAttached);
  EXPECT_THROW(instrument.command("reset"), NotAttached);
}

TEST(InstrumentStandaloneTest, RejectsInvalidAddress) {
  EXPECT_THROW(GenericInstrument(0), InvalidAddress);
  EXPECT_THROW(GenericInstrument(31), InvalidAddress);
  EXPECT_NO_THROW(GenericInstrument(1));
  EXPECT_NO_THROW(GenericInstrument(30));
}

TEST(InstrumentStandaloneTest, BuiltinTablesArePresent) {
  GenericInstrument instrument(3);

  EXPECT_EQ(instrument.commands().list_all(),
            (Lines{"clear", "event_status_enable", "operation_complete",
                   "recall", "reset", "save", "service_request_enable",
                   "wait"}));
  EXPECT_EQ(instrument.queries().list_all(),
            (Lines{"event_status", "event_status_enable", "ident",
                   "operation_complete", "options", "self_test",
                   "service_request_enable", "status_byte"}));
}

TEST_F(InstrumentTest, IdentQueryAddressesAndReturnsRawReply) {
  auto scope = attach(12);
  transport_->set_device_response(12, "*IDN?", "Lab Corp. XJ324");

  ResponseValue ident = scope->query("ident");

  EXPECT_EQ(transport_->written(), (Lines{"++addr 12", "*IDN?"}));
  ASSERT_TRUE(std::holds_alternative<std::string>(ident));
  EXPECT_EQ(std::get<std::string>(ident), "Lab Corp. XJ324");
}

TEST_F(InstrumentTest, IdentKeepsSurroundingSpaces) {
  auto scope = attach(12);
  transport_->set_device_response(12, "*IDN?", "  Lab Corp. XJ324 \r\n");

  EXPECT_EQ(std::get<std::string>(scope->query("ident")),
            "  Lab Corp. XJ324 ");
}

TEST_F(InstrumentTest, QueryWithoutAutoReadAsksForData) {
  controller_->set_auto_read(false);
  transport_->clear_history();
  auto dmm = attach(9);
  transport_->set_device_response(9, "++read eoi", "+0");

  ResponseValue result = dmm->query("self_test");

  EXPECT_EQ(transport_->written(), (Lines{"++addr 9", "*TST?", "++read eoi"}));
  EXPECT_EQ(std::get<int64_t>(result), 0);
}

TEST_F(InstrumentTest, CommandRendersArguments) {
  auto dmm = attach(9);

  dmm->command("reset");
  dmm->command("event_status_enable", 32);
  dmm->command("save", 2);

  EXPECT_EQ(transport_->written(),
            (Lines{"++addr 9", "*RST", "*ESE 32", "*SAV 2"}));
}

TEST_F(InstrumentTest, UnknownNameWritesNothing) {
  auto dmm = attach(9);

  EXPECT_THROW(dmm->command("explode"), UnknownCommand);
  EXPECT_THROW(dmm->query("explode"), UnknownCommand);
  EXPECT_EQ(transport_->write_count(), 0);
}

TEST_F(InstrumentTest, WrongArgumentCountWritesNothing) {
  auto dmm = attach(9);

  EXPECT_THROW(dmm->command("reset", 1), ArityError);
  EXPECT_THROW(dmm->command("save"), ArityError);
  EXPECT_THROW(dmm->query("ident", "extra"), ArityError);
  EXPECT_EQ(transport_->write_count(), 0);
}

TEST_F(InstrumentTest, BuiltinDecodersApply) {
  auto dmm = attach(9);
  transport_->set_device_response(9, "*STB?", "+64");
  transport_->set_device_response(9, "*OPC?", "1");
  transport_->set_device_response(9, "*OPT?", " OPT1,OPT2 \n");

  EXPECT_EQ(std::get<int64_t>(dmm->query("status_byte")), 64);
  EXPECT_TRUE(std::get<bool>(dmm->query("operation_complete")));
  EXPECT_EQ(std::get<std::string>(dmm->query("options")), "OPT1,OPT2");
}

TEST_F(InstrumentTest, UnparseableReplyCarriesRawBytes) {
  auto dmm = attach(9);
  transport_->set_device_response(9, "*ESR?", "garbage");

  try {
    dmm->query("event_status");
    FAIL() << "Expected ResponseParseError";
  } catch (const ResponseParseError &e) {
    EXPECT_EQ(e.raw(), "garbage");
  }
}

TEST_F(InstrumentTest, SilentInstrumentTimesOut) {
  auto dmm = attach(9);

  EXPECT_THROW(dmm->query_with_timeout("ident", std::chrono::milliseconds(30)),
               TimeoutError);
}

TEST_F(InstrumentTest, TimeoutArgumentOverridesDefaults) {
  auto dmm = attach(9);
  transport_->set_device_response(9, "*IDN?", "slow");
  transport_->set_read_delay(std::chrono::milliseconds(100));

  // Instrument default is 200 ms, enough for the delayed reply
  EXPECT_EQ(std::get<std::string>(dmm->query("ident")), "slow");
  EXPECT_THROW(dmm->query_with_timeout("ident", std::chrono::milliseconds(20)),
               TimeoutError);
}

TEST_F(InstrumentTest, LateReplyIsNotHandedToNextInstrument) {
  auto dmm = attach(5);
  auto scope = attach(12);
  transport_->set_device_response(5, "*IDN?", "DMM-5");
  transport_->set_device_response(12, "*IDN?", "SCOPE-12");

  transport_->set_read_delay(std::chrono::milliseconds(50));
  EXPECT_THROW(dmm->query_with_timeout("ident", std::chrono::milliseconds(10)),
               TimeoutError);
  transport_->set_read_delay(std::chrono::milliseconds(0));

  EXPECT_EQ(std::get<std::string>(scope->query("ident")), "SCOPE-12");
}

TEST_F(InstrumentTest, LateReplyIsNotReturnedToNextQuery) {
  auto dmm = attach(5);
  transport_->set_device_response(5, "*IDN?", "DMM-5");
  transport_->set_device_response(5, "*STB?", "16");

  transport_->set_read_delay(std::chrono::milliseconds(50));
  EXPECT_THROW(dmm->query_with_timeout("ident", std::chrono::milliseconds(10)),
               TimeoutError);
  transport_->set_read_delay(std::chrono::milliseconds(0));

  EXPECT_EQ(std::get<int64_t>(dmm->query("status_byte")), 16);
}

TEST_F(InstrumentTest, IdentifyRenamesInstrument) {
  auto scope = attach(12);
  transport_->set_device_response(12, "*IDN?", "Lab Corp. XJ324");

  EXPECT_EQ(scope->identify(), "Lab Corp. XJ324");
  EXPECT_EQ(scope->name(), "Lab Corp. XJ324");
}

TEST_F(InstrumentTest, RawReadAndWrite) {
  auto dmm = attach(9);
  dmm->write("MEAS:VOLT?");
  transport_->queue_read("1.25\n");

  EXPECT_EQ(dmm->read(), "1.25");
  EXPECT_EQ(transport_->written(), (Lines{"++addr 9", "MEAS:VOLT?"}));
}

TEST_F(InstrumentTest, ExtendedDefinitionAddsOperations) {
  auto def = extend_builtins(
      {make_command("set_voltage", "VOLT {0}")},
      {make_query("voltage", "MEAS:VOLT?", "float"),
       make_query("trace", "TRAC:DATA? {0}", "float_list")});
  auto supply = std::make_shared<GenericInstrument>(4, std::move(def));
  controller_->add_instrument(supply);

  transport_->set_device_response(4, "MEAS:VOLT?", "1.5E+00");
  transport_->set_device_response(4, "TRAC:DATA? 1", "1.0,2.5,-3");

  supply->command("set_voltage", 2.5);
  EXPECT_DOUBLE_EQ(std::get<double>(supply->query("voltage")), 1.5);
  EXPECT_EQ(std::get<std::vector<double>>(supply->query("trace", 1)),
            (std::vector<double>{1.0, 2.5, -3.0}));

  auto lines = transport_->written();
  ASSERT_GE(lines.size(), 2u);
  EXPECT_EQ(lines[1], "VOLT 2.5");
}

TEST(InstrumentDefinitionTest, DefinitionWithoutBuiltinsRejected) {
  EXPECT_THROW(GenericInstrument(4, InstrumentDefinition{}),
               std::invalid_argument);
}

TEST(InstrumentDefinitionTest, RedefinedBuiltinRejected) {
  InstrumentDefinition builtins = builtin_definition();
  InstrumentDefinition def;
  for (const auto &name : builtins.commands.list_all()) {
    def.commands.add(builtins.commands.get(name));
  }
  for (const auto &name : builtins.queries.list_all()) {
    if (name != "ident") {
      def.queries.add(builtins.queries.get(name));
    }
  }
  def.queries.add(make_query("ident", "*IDN?", "int"));

  EXPECT_THROW(GenericInstrument(4, std::move(def)), std::invalid_argument);
}

TEST(InstrumentDefinitionTest, ExtensionCannotShadowBuiltins) {
  EXPECT_THROW(extend_builtins({make_command("reset", "SYST:PRES")}, {}),
               std::invalid_argument);
}
