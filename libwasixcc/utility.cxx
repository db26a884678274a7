// file      : libwasixcc/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/utility.hxx>

#ifndef _WIN32
#  include <signal.h> // signal()
#endif

#include <cerrno>   // errno, ERANGE
#include <cstdlib>  // strtoull(), exit()
#include <iostream> // cerr

#include <libwasixcc/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace wasixcc
{
  process_path argv0;

  void
  init_process ()
  {
    // On POSIX ignore SIGPIPE which is signaled to a pipe-writing process if
    // the pipe reading end is closed. Note that by default this signal
    // terminates a process.
    //
#ifndef _WIN32
    if (signal (SIGPIPE, SIG_IGN) == SIG_ERR)
      fail << "unable to ignore broken pipe (SIGPIPE) signal: "
           << system_error (errno, generic_category ()); // Sanitize.
#endif
  }

  void
  init (const char* a0)
  try
  {
    argv0 = process::path_search (a0, true);
  }
  catch (const process_error& e)
  {
    fail << "unable to determine driver path from " << a0 << ": " << e;
  }

  process_path
  run_search (const path& f, bool init)
  try
  {
    return process::path_search (f, init);
  }
  catch (const process_error& e)
  {
    fail << "unable to execute " << f << ": " << e << endf;
  }

  process
  run_start (uint16_t verbosity, const process_path& pp, const cstrings& args)
  try
  {
    assert (args[0] == pp.recall_string ());

    if (verb >= verbosity)
      print_process (args.data ());

    return process (pp, args.data ());
  }
  catch (const process_error& e)
  {
    if (e.child)
    {
      cerr << "unable to execute " << args[0] << ": " << e << endl;

      // In a program that fork()'ed but did not exec(), it is unwise to try
      // to do any kind of cleanup (like unwinding the stack and running
      // destructors).
      //
      exit (1);
    }
    else
      fail << "unable to execute " << args[0] << ": " << e << endf;
  }

  void
  run_finish (const cstrings& args, process& pr, uint16_t v)
  {
    try
    {
      if (pr.wait ())
        return;
    }
    catch (const process_error& e)
    {
      fail << "unable to execute " << args[0] << ": " << e;
    }

    {
      diag_record dr;
      dr << error << "process " << args[0] << " " << *pr.exit;

      if (verb >= 1 && verb <= v)
      {
        dr << info << "command line: ";
        print_process (dr, args.data ());
      }
    }

    throw failed ();
  }

  cstrings
  process_args (const char* program, const strings& args)
  {
    cstrings r;
    r.reserve (args.size () + 2);

    r.push_back (program);

    for (const string& a: args)
      r.push_back (a.c_str ());

    r.push_back (nullptr);
    return r;
  }

  void
  append_options (strings& args, const strings& sv, const char* e)
  {
    if (!sv.empty ())
    {
      args.reserve (args.size () + sv.size ());

      for (const string& s: sv)
      {
        if (e == nullptr || e != s)
          args.push_back (s);
      }
    }
  }

  void
  append_options (strings& args, initializer_list<const char*> os)
  {
    args.reserve (args.size () + os.size ());

    for (const char* o: os)
      args.push_back (o);
  }

  const string*
  find_options (const initializer_list<const char*>& os,
                const strings& strs,
                bool ic)
  {
    for (const string& s: strs)
      for (const char* o: os)
        if (compare_option (o, s, ic))
          return &s;

    return nullptr;
  }

  optional<uint64_t>
  parse_number (const string& s, uint64_t max_num)
  {
    optional<uint64_t> r;

    if (!s.empty ())
    {
      const char* b (s.c_str ());
      char* e (nullptr);
      errno = 0; // We must clear it according to POSIX.
      uint64_t v (strtoull (b, &e, 10)); // Can't throw.

      if (errno != ERANGE && e == b + s.size () && v <= max_num)
        r = v;
    }

    return r;
  }
}
