// file      : libwasixcc/pipeline.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/pipeline.hxx>

#include <libwasixcc/filesystem.hxx>
#include <libwasixcc/diagnostics.hxx>

using namespace std;

namespace wasixcc
{
  path
  output_path (const pipeline_state& s)
  {
    if (s.args.output)
      return *s.args.output;

    return path (linkable (s.kind ()) ? "a.out" : "a.o");
  }

  path
  object_path (const dir_path& d, const path& i, map<string, size_t>& cs)
  {
    string n (i.leaf ().string ());

    if (n.empty ())
      n = "output";

    size_t& c (cs[n]);

    n += '.';
    n += to_string (c++);
    n += ".o";

    return d / path (move (n));
  }

  strings
  compile_arguments (const pipeline_state& s)
  {
    const user_settings& us (s.settings);

    strings r {"--sysroot", us.sysroot ().string ()};

    append_options (r, {"--target=wasm32-wasi",
                        "-c",
                        "-matomics",
                        "-mbulk-memory",
                        "-mmutable-globals",
                        "-pthread",
                        "-mthread-model", "posix",
                        "-fno-trapping-math",
                        "-D_WASI_EMULATED_MMAN",
                        "-D_WASI_EMULATED_SIGNAL",
                        "-D_WASI_EMULATED_PROCESS_CLOCKS"});

    append_options (r, us.compiler_flags);

    if (us.wasm_exceptions)
      r.push_back ("-fwasm-exceptions");

    if (requires_pic (s.kind ()) || us.pic)
      append_options (r, {"-fPIC",
                          "-ftls-model=global-dynamic",
                          "-fvisibility=default"});
    else
      r.push_back ("-ftls-model=local-exec");

    // C++ exceptions are not supported by WASIX.
    //
    if (s.cxx)
      r.push_back ("-fno-exceptions");

    if (s.build.debug != debug_level::none)
      r.push_back ("-g");

    append_options (r, s.args.compiler_args);

    return r;
  }

  strings
  link_arguments (const pipeline_state& s)
  {
    const user_settings& us (s.settings);
    module_kind k (s.kind ());

    assert (linkable (k)); // Object files are never linked.

    dir_path ld (us.sysroot () / dir_path ("lib"));
    dir_path wd (ld / dir_path ("wasm32-wasi"));

    strings r (s.args.linker_args);

    append_options (r, {"--extra-features=atomics",
                        "--extra-features=bulk-memory",
                        "--extra-features=mutable-globals",
                        "--shared-memory",
                        "--max-memory=4294967296",
                        "--import-memory",
                        "--export-dynamic",
                        "--export=__wasm_call_ctors"});

    append_options (r, us.linker_flags);

    if (us.wasm_exceptions)
      append_options (r, {"-mllvm", "--wasm-enable-sjlj"});

    append_options (r, {"--export=__wasm_init_tls",
                        "--export=__wasm_signal",
                        "--export=__tls_size",
                        "--export=__tls_align",
                        "--export=__tls_base"});

    if (executable (k))
      append_options (r, {"--export-if-defined=__stack_pointer",
                          "--export-if-defined=__heap_base",
                          "--export-if-defined=__data_end"});

    if (k == module_kind::dynamic_main)
      append_options (r, {"--whole-archive", "--export-all"});

    if (executable (k))
    {
      r.push_back ("-L" + ld.string ());
      r.push_back ("-L" + wd.string ());

      // Note that libclang_rt is linked into libc.
      //
      append_options (r, {"-lwasi-emulated-mman",
                          "-lc",
                          "-lresolv",
                          "-lrt",
                          "-lm",
                          "-lpthread",
                          "-lutil"});

      if (us.include_cpp_std ? *us.include_cpp_std : s.cxx)
        append_options (r, {"-lc++", "-lc++abi"});
    }

    if (k == module_kind::dynamic_main)
      r.push_back ("--no-whole-archive");

    if (requires_pic (k))
      append_options (r, {"--experimental-pic",
                          "--export-if-defined=__wasm_apply_data_relocs"});

    switch (k)
    {
    case module_kind::static_main:
      {
        append_options (r, {"-z", "stack-size=8388608"});
        break;
      }
    case module_kind::dynamic_main:
      {
        append_options (r, {"-pie", "-lcommon-tag-stubs"});
        break;
      }
    case module_kind::shared_library:
      {
        append_options (r, {"-shared",
                            "--no-entry",
                            "--unresolved-symbols=import-dynamic"});
        break;
      }
    case module_kind::object_file:
      {
        assert (false);
        break;
      }
    }

    for (const path& i: s.args.linker_inputs)
      r.push_back (i.string ());

    r.push_back ((wd / path (executable (k) ? "crt1.o" : "scrt1.o")).string ());

    r.push_back ("-o");
    r.push_back (output_path (s).string ());

    return r;
  }

  optional<strings>
  optimize_arguments (const pipeline_state& s)
  {
    const user_settings& us (s.settings);

    strings r;

    if (us.wasm_exceptions)
      r.push_back ("--experimental-new-eh");

    // -O0 is a noop.
    //
    if (s.build.optimization != optimization_level::O0)
      r.push_back (to_string (s.build.optimization));

    append_options (r, us.wasm_opt_flags);

    if (r.empty ())
      return nullopt;

    switch (s.build.debug)
    {
    case debug_level::none:
    case debug_level::g0:
      break;
    case debug_level::g1:
    case debug_level::g2:
    case debug_level::g3:
      r.push_back ("-g");
      break;
    }

    string o (output_path (s).string ());

    r.push_back (o);
    r.push_back ("-o");
    r.push_back (move (o));

    return r;
  }

  void
  compile_inputs (pipeline_state& s, tool_runner& tr)
  {
    tracer trace ("compile_inputs");

    classified_arguments& a (s.args);

    if (a.compiler_inputs.empty ())
    {
      l4 ([&]{trace << "no compiler inputs, skipping";});
      return;
    }

    path c (s.settings.llvm.tool_path (s.cxx ? "clang++" : "clang"));
    strings ca (compile_arguments (s));

    if (linkable (s.kind ()))
    {
      // Compile each input separately so that we can link them later.
      //
      assert (!s.temp_dir.empty ());

      map<string, size_t> cs;

      for (const path& i: a.compiler_inputs)
      {
        path o (object_path (s.temp_dir, i, cs));

        strings args (ca);
        args.push_back (i.string ());
        args.push_back ("-o");
        args.push_back (o.string ());

        tr.run (c, args);

        a.linker_inputs.push_back (move (o));
      }
    }
    else
    {
      strings args (move (ca));

      for (const path& i: a.compiler_inputs)
        args.push_back (i.string ());

      args.push_back ("-o");
      args.push_back (output_path (s).string ());

      tr.run (c, args);
    }
  }

  void
  link_inputs (const pipeline_state& s, tool_runner& tr)
  {
    tr.run (s.settings.llvm.tool_path ("wasm-ld"), link_arguments (s));
  }

  void
  optimize_output (const pipeline_state& s, tool_runner& tr)
  {
    optional<strings> args (optimize_arguments (s));

    if (!args)
    {
      l2 ([&]{info << "skipping wasm-opt since no passes were specified or "
                   << "needed";});
      return;
    }

    // Note that wasm-opt is not part of LLVM.
    //
    tr.run (path ("wasm-opt"), *args);
  }

  void
  run_compiler (const strings& args,
                bool cxx,
                const environment& env,
                tool_runner& tr)
  {
    tracer trace ("run_compiler");

    pair<strings, strings> sa (separate_settings_arguments (args));

    pipeline_state s;
    s.settings = resolve_settings (sa.first, env);
    s.cxx = cxx;
    s.args = classify_compiler_arguments (sa.second, s.build, s.settings);

    const classified_arguments& a (s.args);

    // Without any inputs pass everything through to the compiler. This
    // covers invocations like -dumpmachine or --help.
    //
    if (a.compiler_inputs.empty () && a.linker_inputs.empty ())
    {
      l4 ([&]{trace << "no inputs, passing through to compiler";});

      tr.run (s.settings.llvm.tool_path (cxx ? "clang++" : "clang"),
              sa.second);
      return;
    }

    // Diagnose a missing sysroot before running anything.
    //
    const dir_path& sr (s.settings.sysroot ());
    l4 ([&]{trace << "sysroot " << sr;});

    auto_rmdir rm;

    if (!a.compiler_inputs.empty () && linkable (s.kind ()))
    {
      create_temp_dir (rm, "wasixcc");
      s.temp_dir = rm.path;
    }

    if (!linkable (s.kind ()) && !a.linker_inputs.empty ())
      warn << "ignoring linker input " << a.linker_inputs.front () <<
        info << "linker inputs are unused when producing " << s.kind ();

    compile_inputs (s, tr);

    if (linkable (s.kind ()))
    {
      link_inputs (s, tr);

      if (s.build.wasm_opt || s.settings.force_wasm_opt)
        optimize_output (s, tr);
    }

    l4 ([&]{trace << "done";});
  }

  void
  run_linker (const strings& args, const environment& env, tool_runner& tr)
  {
    tracer trace ("run_linker");

    pair<strings, strings> sa (separate_settings_arguments (args));

    pipeline_state s;
    s.settings = resolve_settings (sa.first, env);
    s.args = classify_linker_arguments (sa.second, s.settings);

    if (!linkable (s.kind ()))
      fail << "unable to link module of kind " << s.kind () <<
        info << "only executables and shared libraries can be linked";

    if (s.args.linker_inputs.empty ())
      fail << "no input files";

    // There is no compile step to derive these from.
    //
    s.build.optimization = optimization_level::O0;
    s.build.debug = debug_level::none;
    s.build.wasm_opt = s.settings.force_wasm_opt;

    const dir_path& sr (s.settings.sysroot ());
    l4 ([&]{trace << "sysroot " << sr;});

    link_inputs (s, tr);

    if (s.build.wasm_opt)
      optimize_output (s, tr);

    l4 ([&]{trace << "done";});
  }

  void
  run_passthrough (const char* t,
                   const strings& args,
                   const environment& env,
                   tool_runner& tr)
  {
    pair<strings, strings> sa (separate_settings_arguments (args));
    llvm_location l (resolve_llvm_location (sa.first, env));

    tr.run (l.tool_path (t), sa.second);
  }
}
