// file      : libwasixcc/arguments.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

#include <libwasixcc/arguments.hxx>
#include <libwasixcc/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace wasixcc
{
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

  static bool
  operator== (const classified_arguments& x, const classified_arguments& y)
  {
    return x.compiler_args == y.compiler_args     &&
           x.linker_args == y.linker_args         &&
           x.compiler_inputs == y.compiler_inputs &&
           x.linker_inputs == y.linker_inputs     &&
           (x.output ? y.output && *x.output == *y.output : !y.output);
  }

  int
  main (int, char*[])
  {
    using mk = module_kind;
    using ol = optimization_level;
    using dl = debug_level;

    init_diag (1);

    // Kind inference helper: classify the compiler arguments with fresh
    // settings and return the resulting kind.
    //
    auto compiler_kind = [] (const strings& args) -> optional<mk>
    {
      build_settings bs;
      user_settings us;
      classify_compiler_arguments (args, bs, us);
      return us.kind;
    };

    auto linker_kind = [] (const strings& args) -> optional<mk>
    {
      user_settings us;
      classify_linker_arguments (args, us);
      return us.kind;
    };

    auto is = [] (const optional<mk>& k, mk v) {return k && *k == v;};

    // Build settings interpreter.
    //
    {
      build_settings bs;
      user_settings us;

      assert (interpret_flag ("-O3", bs, us) == flag_action::forward);
      assert (bs.optimization == ol::O3);

      assert (interpret_flag ("-Oz", bs, us) == flag_action::forward);
      assert (bs.optimization == ol::Oz);

      assert (interpret_flag ("-g1", bs, us) == flag_action::forward);
      assert (bs.debug == dl::g1);

      assert (interpret_flag ("-g", bs, us) == flag_action::forward);
      assert (bs.debug == dl::g2);

      assert (interpret_flag ("--no-wasm-opt", bs, us) == flag_action::suppress);
      assert (!bs.wasm_opt);

      assert (interpret_flag ("-fwasm-exceptions", bs, us) ==
              flag_action::suppress);
      assert (us.wasm_exceptions);

      assert (interpret_flag ("-fno-wasm-exceptions", bs, us) ==
              flag_action::forward);
      assert (!us.wasm_exceptions);

      assert (interpret_flag ("-Wall", bs, us) == flag_action::forward);
      assert (interpret_flag ("-I", bs, us) == flag_action::forward_value);
      assert (interpret_flag ("-include", bs, us) == flag_action::forward_value);
      assert (interpret_flag ("-Ifoo", bs, us) == flag_action::forward);

      assert (fails ([&bs, &us] {interpret_flag ("-O", bs, us);}));
      assert (fails ([&bs, &us] {interpret_flag ("-O5", bs, us);}));
      assert (fails ([&bs, &us] {interpret_flag ("-Ofast", bs, us);}));
      assert (fails ([&bs, &us] {interpret_flag ("-g4", bs, us);}));
      assert (fails ([&bs, &us] {interpret_flag ("-gdwarf", bs, us);}));
    }

    // Flag tables.
    //
    {
      assert ( compiler_flag_with_argument ("-MF"));
      assert ( compiler_flag_with_argument ("-mthread-model"));
      assert ( compiler_flag_with_argument ("-Xclang"));
      assert (!compiler_flag_with_argument ("-m"));
      assert (!compiler_flag_with_argument ("-c"));

      assert ( linker_flag_with_argument ("-m"));
      assert ( linker_flag_with_argument ("-y"));
      assert (!linker_flag_with_argument ("-MF"));
      assert (!linker_flag_with_argument ("-shared"));
    }

    // Compiler command line.
    //
    {
      const strings args {"-O2", "-g0",
                          "-fwasm-exceptions",
                          "--no-wasm-opt",
                          "-Wl,-foo,bar",
                          "-Xlinker", "baz",
                          "-z", "zo",
                          "-o", "out",
                          "in.c",
                          "lib.o"};

      build_settings bs;
      user_settings us;
      classified_arguments r (classify_compiler_arguments (args, bs, us));

      assert (bs.optimization == ol::O2);
      assert (bs.debug == dl::g0);
      assert (!bs.wasm_opt);
      assert (us.wasm_exceptions);

      assert ((r.compiler_args == strings {"-O2", "-g0"}));
      assert ((r.linker_args == strings {"-foo", "bar", "baz", "-z", "zo"}));
      assert (r.output && *r.output == path ("out"));
      assert ((r.compiler_inputs == paths {path ("in.c")}));
      assert ((r.linker_inputs == paths {path ("lib.o")}));

      assert (!us.kind);

      // Classifying again with fresh settings gives the same result.
      //
      build_settings bs2;
      user_settings us2;
      assert (classify_compiler_arguments (args, bs2, us2) == r);
    }

    // Linker option forwarding.
    //
    {
      build_settings bs;
      user_settings us;

      classified_arguments r (
        classify_compiler_arguments (
          {"-Wl,a", "-Wl,a,b", "-Wl,x,y,z", "-Wl,--export=f"}, bs, us));

      assert ((r.linker_args ==
               strings {"a", "a", "b", "x", "y,z", "--export=f"}));
      assert (r.compiler_args.empty ());
    }

    // Options with values.
    //
    {
      build_settings bs;
      user_settings us;

      classified_arguments r (
        classify_compiler_arguments (
          {"-I", "inc", "-D", "X=1", "-include", "pre.h", "-x", "c", "a.S",
           "b.cpp", "liba.a"}, bs, us));

      assert ((r.compiler_args ==
               strings {"-I", "inc", "-D", "X=1", "-include", "pre.h",
                        "-x", "c"}));
      assert ((r.compiler_inputs == paths {path ("a.S"), path ("b.cpp")}));
      assert ((r.linker_inputs == paths {path ("liba.a")}));
    }

    // Missing option values.
    //
    {
      for (const char* o: {"-Xlinker", "-z", "-o", "-I", "-MF", "-mllvm"})
      {
        assert (fails ([o] {
              build_settings bs;
              user_settings us;
              classify_compiler_arguments ({"foo.c", o}, bs, us);}));
      }

      for (const char* o: {"-o", "-m", "-L"})
      {
        assert (fails ([o] {
              user_settings us;
              classify_linker_arguments ({"foo.o", o}, us);}));
      }
    }

    // Module kind inference.
    //
    {
      // From the output extension.
      //
      assert (is (compiler_kind ({"-o", "foo.so", "a.c"}), mk::shared_library));
      assert (is (compiler_kind ({"-o", "foo.o", "a.c"}), mk::object_file));
      assert (!compiler_kind ({"-o", "foo.wasm", "a.c"}));
      assert (!compiler_kind ({"-o", "foo", "a.c"}));

      // From the compiler options.
      //
      assert (is (compiler_kind ({"-c", "a.c"}), mk::object_file));
      assert (is (compiler_kind ({"-S", "a.c"}), mk::object_file));
      assert (is (compiler_kind ({"-E", "a.c"}), mk::object_file));
      assert (is (compiler_kind ({"-shared", "a.c"}), mk::shared_library));
      assert (is (compiler_kind ({"-c", "-shared", "a.c"}), mk::object_file));

      // From the linker options.
      //
      assert (is (compiler_kind ({"-Wl,-pie", "a.c"}), mk::dynamic_main));
      assert (is (compiler_kind ({"-Wl,-shared", "a.c"}), mk::shared_library));
      assert (is (compiler_kind ({"-Xlinker", "-pie", "-Wl,-shared", "a.c"}),
                  mk::dynamic_main));

      // Compiler options take precedence over the linker ones.
      //
      assert (is (compiler_kind ({"-Wl,-pie", "-c", "a.c"}), mk::object_file));

      // Output extension takes precedence over the options.
      //
      assert (is (compiler_kind ({"-c", "-o", "foo.so", "a.c"}),
                  mk::shared_library));

      // Explicit kind is never overridden.
      //
      {
        build_settings bs;
        user_settings us;
        us.kind = mk::dynamic_main;
        classify_compiler_arguments ({"-c", "-shared", "-o", "foo.o", "a.c"},
                                     bs,
                                     us);
        assert (*us.kind == mk::dynamic_main);
      }

      {
        user_settings us;
        us.kind = mk::static_main;
        classify_linker_arguments ({"-shared", "-o", "libfoo.so", "a.o"}, us);
        assert (*us.kind == mk::static_main);
      }
    }

    // Linker command line.
    //
    {
      user_settings us;
      classified_arguments r (
        classify_linker_arguments (
          {"-o", "out.wasm", "-shared", "-m", "module", "mod.wasm"}, us));

      assert (is (us.kind, mk::shared_library));
      assert ((r.linker_args == strings {"-shared", "-m", "module"}));
      assert ((r.linker_inputs == paths {path ("mod.wasm")}));
      assert (r.output && *r.output == path ("out.wasm"));
      assert (r.compiler_args.empty () && r.compiler_inputs.empty ());

      assert (is (linker_kind ({"-pie", "a.o"}), mk::dynamic_main));
      assert (is (linker_kind ({"-o", "a.o", "b.o"}), mk::object_file));
      assert (!linker_kind ({"-L", "lib", "a.o"}));
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return wasixcc::main (argc, argv);
}
