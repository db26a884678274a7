// file      : libwasixcc/pipeline.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_PIPELINE_HXX
#define LIBWASIXCC_PIPELINE_HXX

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

#include <libwasixcc/tool.hxx>
#include <libwasixcc/settings.hxx>
#include <libwasixcc/arguments.hxx>
#include <libwasixcc/module-kind.hxx>

namespace wasixcc
{
  // Build pipeline: compile, then link (linkable modules only), then
  // optimize with wasm-opt (linkable modules only and if enabled or forced).
  // Any failure aborts the remaining stages.
  //
  struct pipeline_state
  {
    user_settings settings;
    build_settings build;
    classified_arguments args;

    // True if compiling C++ (clang++). Also determines whether the C++
    // standard library is linked unless overridden with INCLUDE_CPP_STD.
    //
    bool cxx = false;

    // Directory for the intermediate object files. Only used when compiling
    // a linkable module.
    //
    dir_path temp_dir;

    module_kind
    kind () const {return settings.effective_kind ();}
  };

  // Return the explicit output path or the default (a.out or, for the object
  // file, a.o).
  //
  path
  output_path (const pipeline_state&);

  // Return the object file path in the temporary directory for the input:
  // <temp_dir>/<input-leaf>.<n>.o where n counts inputs with the same leaf
  // name starting from 0.
  //
  path
  object_path (const dir_path& temp_dir,
               const path& input,
               map<string, size_t>& counters);

  // Return the compiler arguments shared by all the compile invocations
  // (without the inputs and the output).
  //
  strings
  compile_arguments (const pipeline_state&);

  // Return the complete wasm-ld command line arguments.
  //
  strings
  link_arguments (const pipeline_state&);

  // Return the complete wasm-opt command line arguments or nullopt if there
  // is nothing for it to do.
  //
  optional<strings>
  optimize_arguments (const pipeline_state&);

  // Pipeline stages.
  //
  // Compile the compiler inputs. For a linkable module compile each input
  // into a separate object file in the temporary directory and add it to the
  // linker inputs. For the object file compile all the inputs with a single
  // invocation into the output.
  //
  void
  compile_inputs (pipeline_state&, tool_runner&);

  void
  link_inputs (const pipeline_state&, tool_runner&);

  void
  optimize_output (const pipeline_state&, tool_runner&);

  // Entry points. The arguments are the command line arguments without the
  // program name and include the inline settings.
  //
  // Compile and link, as C or C++. If there are no inputs, then pass the
  // arguments through to the compiler (for -dumpmachine, --help, etc).
  //
  void
  run_compiler (const strings& args,
                bool cxx,
                const environment&,
                tool_runner&);

  // Link only. Optimization and debug levels are fixed to none and wasm-opt
  // runs only if forced.
  //
  void
  run_linker (const strings& args, const environment&, tool_runner&);

  // Pass the arguments through to an LLVM binary utility (llvm-ar, llvm-nm,
  // llvm-ranlib).
  //
  void
  run_passthrough (const char* tool,
                   const strings& args,
                   const environment&,
                   tool_runner&);
}

#endif // LIBWASIXCC_PIPELINE_HXX
