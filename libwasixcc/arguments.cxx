// file      : libwasixcc/arguments.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/arguments.hxx>

#include <cstring> // strlen()

#include <libwasixcc/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace wasixcc
{
  const char*
  to_string (optimization_level l) noexcept
  {
    switch (l)
    {
    case optimization_level::O0: return "-O0";
    case optimization_level::O1: return "-O1";
    case optimization_level::O2: return "-O2";
    case optimization_level::O3: return "-O3";
    case optimization_level::O4: return "-O4";
    case optimization_level::Os: return "-Os";
    case optimization_level::Oz: return "-Oz";
    }

    return ""; // Can't happen.
  }

  const char*
  to_string (debug_level l) noexcept
  {
    switch (l)
    {
    case debug_level::none: return "none";
    case debug_level::g0:   return "-g0";
    case debug_level::g1:   return "-g1";
    case debug_level::g2:   return "-g2";
    case debug_level::g3:   return "-g3";
    }

    return ""; // Can't happen.
  }

  ostream&
  operator<< (ostream& os, const classified_arguments& a)
  {
    auto print = [&os] (const char* n, const strings& v)
    {
      os << n << ':';
      for (const string& s: v)
        os << ' ' << s;
    };

    auto print_paths = [&os] (const char* n, const paths& v)
    {
      os << n << ':';
      for (const path& p: v)
        os << ' ' << p;
    };

    print ("compiler args", a.compiler_args);
    os << "; ";
    print ("linker args", a.linker_args);
    os << "; ";
    print_paths ("compiler inputs", a.compiler_inputs);
    os << "; ";
    print_paths ("linker inputs", a.linker_inputs);

    if (a.output)
      os << "; output: " << *a.output;

    return os;
  }

  // Options that consume the following argument.
  //
  static const char* const clang_flags_with_argument[] = {
    "-MT", "-MF", "-MJ", "-MQ",
    "-D", "-U",
    "-o", "-x",
    "-Xpreprocessor",
    "-include", "-imacros", "-idirafter",
    "-iprefix", "-iwithprefix", "-iwithprefixbefore",
    "-isysroot", "-imultilib",
    "-A",
    "-isystem", "-iquote",
    "-install_name", "-compatibility_version", "-current_version",
    "-mllvm", "-mthread-model",
    "-I", "-l", "-L",
    "-include-pch",
    "-u", "-undefined",
    "-target",
    "-Xlinker", "-Xclang",
    "-z"};

  static const char* const wasm_ld_flags_with_argument[] = {
    "-o", "-mllvm", "-L", "-l", "-m", "-O", "-y", "-z"};

  bool
  compiler_flag_with_argument (const string& a)
  {
    const char* o (a.c_str ());
    auto b (begin (clang_flags_with_argument));
    auto e (end (clang_flags_with_argument));

    return find_option (o, b, e) != e;
  }

  bool
  linker_flag_with_argument (const string& a)
  {
    const char* o (a.c_str ());
    auto b (begin (wasm_ld_flags_with_argument));
    auto e (end (wasm_ld_flags_with_argument));

    return find_option (o, b, e) != e;
  }

  flag_action
  interpret_flag (const string& a, build_settings& bs, user_settings& us)
  {
    if (a.compare (0, 2, "-O") == 0)
    {
      string l (a, 2);

      if      (l == "0") bs.optimization = optimization_level::O0;
      else if (l == "1") bs.optimization = optimization_level::O1;
      else if (l == "2") bs.optimization = optimization_level::O2;
      else if (l == "3") bs.optimization = optimization_level::O3;
      else if (l == "4") bs.optimization = optimization_level::O4;
      else if (l == "s") bs.optimization = optimization_level::Os;
      else if (l == "z") bs.optimization = optimization_level::Oz;
      else
        fail << "invalid optimization level option '" << a << "'";

      return flag_action::forward;
    }

    if (a.compare (0, 2, "-g") == 0)
    {
      string l (a, 2);

      if      (l == "" ||
               l == "2") bs.debug = debug_level::g2;
      else if (l == "0") bs.debug = debug_level::g0;
      else if (l == "1") bs.debug = debug_level::g1;
      else if (l == "3") bs.debug = debug_level::g3;
      else
        fail << "invalid debug level option '" << a << "'";

      return flag_action::forward;
    }

    if (a == "-fwasm-exceptions")
    {
      // We add our own, so don't duplicate it.
      //
      us.wasm_exceptions = true;
      return flag_action::suppress;
    }

    if (a == "-fno-wasm-exceptions")
    {
      us.wasm_exceptions = false;
      return flag_action::forward;
    }

    if (a == "--no-wasm-opt")
    {
      bs.wasm_opt = false;
      return flag_action::suppress;
    }

    return compiler_flag_with_argument (a)
      ? flag_action::forward_value
      : flag_action::forward;
  }

  // Convert the argument to path issuing diagnostics if it is invalid.
  //
  static path
  to_path (const string& a)
  try
  {
    return path (a);
  }
  catch (const invalid_path& e)
  {
    fail << "invalid path '" << e.path << "'" << endf;
  }

  // Return the argument following the option at i, advancing i. Issue
  // diagnostics and throw failed if there is none.
  //
  static const string&
  next_argument (const strings& args, size_t& i)
  {
    const string& o (args[i]);

    if (++i == args.size ())
      fail << "expected argument after " << o;

    return args[i];
  }

  // Set the output path and, if the module kind is not yet known, infer it
  // from the extension.
  //
  static void
  set_output (classified_arguments& r, const string& a, user_settings& us)
  {
    path o (to_path (a));

    if (!us.kind)
      us.kind = extension_module_kind (o);

    r.output = move (o);
  }

  static inline bool
  suffix (const string& s, const char* x)
  {
    size_t n (strlen (x));
    return s.size () >= n && s.compare (s.size () - n, n, x) == 0;
  }

  classified_arguments
  classify_compiler_arguments (const strings& args,
                               build_settings& bs,
                               user_settings& us)
  {
    tracer trace ("classify_compiler_arguments");

    classified_arguments r;

    for (size_t i (0); i != args.size (); ++i)
    {
      const string& a (args[i]);

      if (a.compare (0, 4, "-Wl,") == 0)
      {
        // Only split on the first comma.
        //
        size_t p (a.find (',', 4));

        if (p == string::npos)
          r.linker_args.push_back (string (a, 4));
        else
        {
          r.linker_args.push_back (string (a, 4, p - 4));
          r.linker_args.push_back (string (a, p + 1));
        }
      }
      else if (a == "-Xlinker")
      {
        r.linker_args.push_back (next_argument (args, i));
      }
      else if (a == "-z")
      {
        const string& v (next_argument (args, i));
        r.linker_args.push_back (a);
        r.linker_args.push_back (v);
      }
      else if (a == "-o")
      {
        set_output (r, next_argument (args, i), us);
      }
      else if (!a.empty () && a[0] == '-')
      {
        switch (interpret_flag (a, bs, us))
        {
        case flag_action::suppress:
          break;
        case flag_action::forward:
          r.compiler_args.push_back (a);
          break;
        case flag_action::forward_value:
          {
            const string& v (next_argument (args, i));
            r.compiler_args.push_back (a);
            r.compiler_args.push_back (v);
            break;
          }
        }
      }
      else
      {
        if (suffix (a, ".o") || suffix (a, ".a"))
          r.linker_inputs.push_back (to_path (a));
        else
          r.compiler_inputs.push_back (to_path (a));
      }
    }

    infer_module_kind (r, us);

    l4 ([&]{trace << r;});
    l4 ([&]{trace << "module kind: " << us.effective_kind ()
                  << ", optimization: " << bs.optimization
                  << ", debug: " << bs.debug
                  << ", wasm-opt: " << bs.wasm_opt;});

    return r;
  }

  classified_arguments
  classify_linker_arguments (const strings& args, user_settings& us)
  {
    tracer trace ("classify_linker_arguments");

    classified_arguments r;

    for (size_t i (0); i != args.size (); ++i)
    {
      const string& a (args[i]);

      if (a == "-o")
      {
        set_output (r, next_argument (args, i), us);
      }
      else if (!a.empty () && a[0] == '-')
      {
        r.linker_args.push_back (a);

        if (linker_flag_with_argument (a))
          r.linker_args.push_back (next_argument (args, i));
      }
      else
        r.linker_inputs.push_back (to_path (a));
    }

    infer_module_kind (r, us);

    l4 ([&]{trace << r;});
    l4 ([&]{trace << "module kind: " << us.effective_kind ();});

    return r;
  }

  void
  infer_module_kind (const classified_arguments& r, user_settings& us)
  {
    if (us.kind)
      return;

    for (const string& a: r.compiler_args)
    {
      if (a == "-shared")
      {
        us.kind = module_kind::shared_library;
        return;
      }

      if (a == "-c" || a == "-S" || a == "-E")
      {
        us.kind = module_kind::object_file;
        return;
      }
    }

    for (const string& a: r.linker_args)
    {
      if (a == "-shared")
      {
        us.kind = module_kind::shared_library;
        return;
      }

      if (a == "-pie")
      {
        us.kind = module_kind::dynamic_main;
        return;
      }
    }
  }
}
