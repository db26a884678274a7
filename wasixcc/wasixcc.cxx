// file      : wasixcc/wasixcc.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>  // cout
#include <exception> // terminate(), set_terminate(), terminate_handler

#include <libbutl/backtrace.hxx> // backtrace()

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

#include <libwasixcc/tool.hxx>
#include <libwasixcc/command.hxx>
#include <libwasixcc/version.hxx>
#include <libwasixcc/settings.hxx>
#include <libwasixcc/diagnostics.hxx>

using namespace butl;
using namespace std;

namespace wasixcc
{
  int
  main (int argc, char* argv[]);

  // Return the path to this executable as found by the process search.
  //
  static path
  executable_path ()
  {
    try
    {
      return path (argv0.effect_string ());
    }
    catch (const invalid_path& e)
    {
      fail << "invalid executable path '" << e.path << "'" << endf;
    }
  }
}

// Print backtrace if terminating due to an unhandled exception. Note that
// custom_terminate is non-static and not a lambda to reduce the noise.
//
static terminate_handler default_terminate;

void
custom_terminate ()
{
  *diag_stream << backtrace ();

  if (default_terminate != nullptr)
    default_terminate ();
}

int wasixcc::
main (int argc, char* argv[])
{
  default_terminate = set_terminate (custom_terminate);

  tracer trace ("main");

  int r (0);

  try
  {
    init_process ();
    init (argv[0]);

    strings args (argv + 1, argv + argc);
    environment env (process_environment ());

    // Initialize the diagnostics state. The verbosity is a setting so it has
    // to be resolved before anything else.
    //
    init_diag (
      resolve_verbosity (separate_settings_arguments (args).first, env));

    // Handle install-executables.
    //
    if (!args.empty () && args[0] == "install-executables")
    {
      if (args.size () < 2)
        fail << "directory expected" <<
          info << "usage: wasixcc install-executables <dir>";

      dir_path d;
      try
      {
        d = dir_path (args[1]);
      }
      catch (const invalid_path& e)
      {
        fail << "invalid directory '" << e.path << "'";
      }

      if (d.empty ())
        fail << "empty directory";

      install_executables (d, executable_path ());
      return 0;
    }

    // Handle --version.
    //
    if (find_options ({"--version", "-v"}, args) != nullptr)
    {
      auto& o (cout);

      o << "wasixcc " << LIBWASIXCC_VERSION_ID << endl
        << "libbutl " << LIBBUTL_VERSION_ID << endl;

      o << "This is free software released under the MIT license." << endl;
      return 0;
    }

    // Determine the command from the name we were executed as.
    //
    optional<string> n;
    try
    {
      n = command_name (path (argv[0]));
    }
    catch (const invalid_path& e)
    {
      fail << "invalid executable path '" << e.path << "'";
    }

    if (!n)
      fail << "unable to determine command from executable name "
           << argv[0] <<
        info << "this program must be run as wasix-<command> or "
             << "wasix<command>, for example, wasix-cc";

    optional<command> c (parse_command (*n));

    if (!c)
      fail << "unknown command '" << *n << "'" <<
        info << "known commands are cc, ++, cc++, ld, ar, nm, and ranlib";

    l4 ([&]{trace << "running " << *c << " command";});

    process_runner pr;
    run_command (*c, args, env, pr);
  }
  catch (const failed&)
  {
    // Diagnostics has already been issued.
    //
    r = 1;
  }

  return r;
}

int
main (int argc, char* argv[])
{
  return wasixcc::main (argc, argv);
}
