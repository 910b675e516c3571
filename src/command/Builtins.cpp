#include "pl-gpib/command/Builtins.hpp"

namespace plgpib {

InstrumentDefinition builtin_definition() {
  InstrumentDefinition def;

  def.commands.add(make_command("reset", "*RST"));
  def.commands.add(make_command("clear", "*CLS"));
  def.commands.add(make_command("wait", "*WAI"));
  def.commands.add(make_command("save", "*SAV", 1));
  def.commands.add(make_command("recall", "*RCL", 1));
  def.commands.add(make_command("event_status_enable", "*ESE", 1));
  def.commands.add(make_command("service_request_enable", "*SRE", 1));
  def.commands.add(make_command("operation_complete", "*OPC"));

  // Identification stays undecoded so callers get the exact bytes
  def.queries.add(make_query("ident", "*IDN?"));
  def.queries.add(make_query("self_test", "*TST?", "int"));
  def.queries.add(make_query("status_byte", "*STB?", "int"));
  def.queries.add(make_query("event_status", "*ESR?", "int"));
  def.queries.add(make_query("event_status_enable", "*ESE?", "int"));
  def.queries.add(make_query("service_request_enable", "*SRE?", "int"));
  def.queries.add(make_query("operation_complete", "*OPC?", "bool"));
  def.queries.add(make_query("options", "*OPT?", "string"));

  return def;
}

} // namespace plgpib
