// file      : libwasixcc/settings.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

#include <libwasixcc/settings.hxx>
#include <libwasixcc/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace wasixcc
{
  // Return the environment backed by the map.
  //
  static environment
  map_environment (const map<string, string>& m)
  {
    return [m] (const string& n) -> optional<string>
    {
      auto i (m.find (n));
      if (i != m.end ())
        return i->second;

      return nullopt;
    };
  }

  template <typename F>
  static bool
  fails (F f)
  {
    try
    {
      f ();
      return false;
    }
    catch (const failed&)
    {
      return true;
    }
  }

  int
  main (int, char*[])
  {
    init_diag (1);

    environment no_env (map_environment ({}));

    // Inline settings recognition.
    //
    {
      assert ( setting_argument ("-sSYSROOT=/sysroot"));
      assert ( setting_argument ("-sMODULE_KIND="));
      assert ( setting_argument ("-sWASM_OPT_FLAGS=-O3=x"));
      assert ( setting_argument ("-sX1_2=y"));

      assert (!setting_argument ("-std=c++17"));
      assert (!setting_argument ("-shared"));
      assert (!setting_argument ("-s"));
      assert (!setting_argument ("-s=x"));
      assert (!setting_argument ("-sSYSROOT"));
      assert (!setting_argument ("-ssysroot=x"));
      assert (!setting_argument ("-sFOO-BAR=x"));
      assert (!setting_argument ("sSYSROOT=x"));

      pair<strings, strings> r (
        separate_settings_arguments ({"-O2",
                                      "-sSYSROOT=/a",
                                      "-std=c11",
                                      "foo.c",
                                      "-sPIC=1"}));

      assert ((r.first  == strings {"-sSYSROOT=/a", "-sPIC=1"}));
      assert ((r.second == strings {"-O2", "-std=c11", "foo.c"}));
    }

    // Lookup precedence.
    //
    {
      environment env (map_environment ({{"WASIXCC_SYSROOT", "/env"},
                                         {"WASIXCC_PIC", "yes"}}));

      strings ss {"-sSYSROOT=/first", "-sSYSROOT=/second"};

      optional<string> v (lookup_setting ("SYSROOT", ss, env));
      assert (v && *v == "/first");

      v = lookup_setting ("PIC", ss, env);
      assert (v && *v == "yes");

      v = lookup_setting ("FORCE_WASM_OPT", ss, env);
      assert (!v);

      // The value is everything after the first `=`.
      //
      v = lookup_setting ("COMPILER_FLAGS", {"-sCOMPILER_FLAGS=-DX=1"}, env);
      assert (v && *v == "-DX=1");

      // Prefix of another name does not match.
      //
      v = lookup_setting ("PIC", {"-sPICK=1"}, no_env);
      assert (!v);
    }

    // Booleans.
    //
    {
      for (const char* t: {"1", "true", "yes", "TRUE", "Yes", "tRuE", " 1 "})
        assert (parse_bool_setting ("PIC", t));

      for (const char* f: {"0", "false", "no", "FALSE", "No", "fAlSe"})
        assert (!parse_bool_setting ("PIC", f));

      for (const char* x: {"", "2", "on", "off", "y", "n", "truee"})
        assert (fails ([x] {parse_bool_setting ("PIC", x);}));
    }

    // Lists.
    //
    {
      assert ((parse_list_setting ("a:b\\:c:d") ==
               strings {"a", "b:c", "d"}));

      assert ((parse_list_setting ("a::b") == strings {"a", "b"}));
      assert ((parse_list_setting (":a:b:") == strings {"a", "b"}));
      assert ((parse_list_setting ("  a : b  ") == strings {"a", "b"}));
      assert ((parse_list_setting ("-O3") == strings {"-O3"}));
      assert ((parse_list_setting ("a\\b") == strings {"a\\b"}));
      assert ((parse_list_setting ("\\:") == strings {":"}));

      assert (parse_list_setting ("").empty ());
      assert (parse_list_setting (" : : ").empty ());
    }

    // Toolchain location.
    //
    {
      llvm_location l;
      assert ((l.tool_path ("clang") == path ("clang-20")));

      l.directory = dir_path ("/opt/llvm/bin");
      assert ((l.tool_path ("wasm-ld") == path ("/opt/llvm/bin/wasm-ld")));

      l = resolve_llvm_location ({}, no_env);
      assert (!l.directory && l.version == default_llvm_version);

      l = resolve_llvm_location (
        {}, map_environment ({{"WASIXCC_LLVM_LOCATION", "/usr/lib/llvm"}}));
      assert (l.directory && *l.directory == dir_path ("/usr/lib/llvm"));
    }

    // Full resolution.
    //
    {
      user_settings s (resolve_settings ({}, no_env));

      assert (!s.sysroot_location);
      assert (s.compiler_flags.empty () &&
              s.linker_flags.empty () &&
              s.wasm_opt_flags.empty ());
      assert (!s.force_wasm_opt && !s.wasm_exceptions && !s.pic);
      assert (!s.include_cpp_std);
      assert (!s.kind);
      assert (s.effective_kind () == module_kind::static_main);

      // Missing sysroot is only diagnosed when asked for.
      //
      assert (fails ([&s] {s.sysroot ();}));

      environment env (
        map_environment ({{"WASIXCC_SYSROOT", "/env/sysroot"},
                          {"WASIXCC_LINKER_FLAGS", "--env"},
                          {"WASIXCC_COMPILER_FLAGS", "-DENV"},
                          {"WASIXCC_WASM_EXCEPTIONS", "true"},
                          {"WASIXCC_MODULE_KIND", "static-main"}}));

      s = resolve_settings ({"-sSYSROOT=/sysroot",
                             "-sCOMPILER_FLAGS=-DA:-DB",
                             "-sWASM_OPT_FLAGS=--strip-debug",
                             "-sFORCE_WASM_OPT=yes",
                             "-sMODULE_KIND=shared-library",
                             "-sPIC=1",
                             "-sINCLUDE_CPP_STD=no"},
                            env);

      assert (s.sysroot () == dir_path ("/sysroot"));

      // Flags and environment are not combined.
      //
      assert ((s.compiler_flags == strings {"-DA", "-DB"}));
      assert ((s.linker_flags == strings {"--env"}));
      assert ((s.wasm_opt_flags == strings {"--strip-debug"}));

      assert (s.force_wasm_opt);
      assert (s.wasm_exceptions);
      assert (s.pic);
      assert (s.include_cpp_std && !*s.include_cpp_std);
      assert (s.kind && *s.kind == module_kind::shared_library);
    }

    // Invalid values.
    //
    {
      assert (fails ([&no_env] {
            resolve_settings ({"-sMODULE_KIND=library"}, no_env);}));

      assert (fails ([&no_env] {
            resolve_settings ({"-sFORCE_WASM_OPT=maybe"}, no_env);}));

      assert (fails ([] {
            resolve_settings (
              {}, map_environment ({{"WASIXCC_WASM_EXCEPTIONS", "2"}}));}));
    }

    // Verbosity.
    //
    {
      assert (resolve_verbosity ({}, no_env) == 1);
      assert (resolve_verbosity ({"-sVERBOSITY=3"}, no_env) == 3);
      assert (resolve_verbosity (
                {}, map_environment ({{"WASIXCC_VERBOSITY", "0"}})) == 0);

      assert (fails ([&no_env] {resolve_verbosity ({"-sVERBOSITY=7"}, no_env);}));
      assert (fails ([&no_env] {resolve_verbosity ({"-sVERBOSITY=x"}, no_env);}));
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return wasixcc::main (argc, argv);
}
