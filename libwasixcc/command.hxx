// file      : libwasixcc/command.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_COMMAND_HXX
#define LIBWASIXCC_COMMAND_HXX

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

#include <libwasixcc/tool.hxx>
#include <libwasixcc/settings.hxx>

namespace wasixcc
{
  // The driver command is derived from the name it is executed as:
  // wasix-<command> or wasix<command>. For example, wasixcc, wasix-cc++,
  // or wasixld.
  //
  enum class command
  {
    cc,    // cc
    cxx,   // ++, cc++
    ld,    // ld
    ar,    // ar
    nm,    // nm
    ranlib // ranlib
  };

  const char*
  to_string (command) noexcept;

  inline ostream&
  operator<< (ostream& os, command c) {return os << to_string (c);}

  // All the command names (as used in the executable names).
  //
  extern const char* const command_names[7];

  // Return the command name for the executable or nullopt if the name
  // doesn't start with wasix.
  //
  optional<string>
  command_name (const path& program);

  // Return nullopt if the command name is unknown.
  //
  optional<command>
  parse_command (const string& name);

  // Run the command with the specified arguments (without the program name).
  //
  void
  run_command (command,
               const strings& args,
               const environment&,
               tool_runner&);

  // Create the directory if necessary and for every command replace
  // <dir>/wasix<command> with a symlink to the executable with all the
  // symlinks in its path resolved. Print each created path to stdout.
  //
  void
  install_executables (const dir_path&, const path& executable);
}

#endif // LIBWASIXCC_COMMAND_HXX
