// file      : libwasixcc/arguments.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_ARGUMENTS_HXX
#define LIBWASIXCC_ARGUMENTS_HXX

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

#include <libwasixcc/settings.hxx>
#include <libwasixcc/module-kind.hxx>

namespace wasixcc
{
  enum class optimization_level: uint8_t {O0, O1, O2, O3, O4, Os, Oz};

  // Return the level as the option (for example, -O2).
  //
  const char*
  to_string (optimization_level) noexcept;

  inline ostream&
  operator<< (ostream& os, optimization_level l) {return os << to_string (l);}

  // Note: bare -g is g2.
  //
  enum class debug_level: uint8_t {none, g0, g1, g2, g3};

  const char*
  to_string (debug_level) noexcept;

  inline ostream&
  operator<< (ostream& os, debug_level l) {return os << to_string (l);}

  // Settings derived from the compiler command line.
  //
  struct build_settings
  {
    optimization_level optimization = optimization_level::O0;
    debug_level        debug = debug_level::none;
    bool               wasm_opt = true;
  };

  // The command line split between the compiler and the linker. The compile
  // stage appends the objects it produces to the linker inputs.
  //
  struct classified_arguments
  {
    strings compiler_args;
    strings linker_args;

    paths compiler_inputs;
    paths linker_inputs;

    optional<path> output;
  };

  ostream&
  operator<< (ostream&, const classified_arguments&);

  // What to do with the flag after it has been interpreted.
  //
  enum class flag_action
  {
    forward,       // Forward to the compiler.
    forward_value, // Forward together with the following argument.
    suppress       // Consumed by the driver.
  };

  // Interpret the compiler flag updating the build and user settings.
  // Issue diagnostics and throw failed if the -O or -g level is invalid.
  //
  // -O<level>               sets the optimization level, forwarded
  // -g[<level>]             sets the debug level, forwarded
  // -fwasm-exceptions       enables wasm exceptions, suppressed
  // -fno-wasm-exceptions    disables wasm exceptions, forwarded
  // --no-wasm-opt           disables wasm-opt, suppressed
  //
  flag_action
  interpret_flag (const string&, build_settings&, user_settings&);

  // Return true if the compiler (clang) or linker (wasm-ld) flag consumes
  // the following argument.
  //
  bool
  compiler_flag_with_argument (const string&);

  bool
  linker_flag_with_argument (const string&);

  // Classify the compiler command line. Issue diagnostics and throw failed
  // on invalid arguments. If the module kind is not set, infer it from the
  // output file extension and then from the arguments.
  //
  classified_arguments
  classify_compiler_arguments (const strings&, build_settings&, user_settings&);

  // As above but for the linker command line. Everything that is not an
  // option is a linker input.
  //
  classified_arguments
  classify_linker_arguments (const strings&, user_settings&);

  // If the module kind is not set, infer it from the forwarded arguments:
  // first compiler -shared (shared library) or -c/-S/-E (object file), then
  // linker -shared (shared library) or -pie (dynamic main).
  //
  void
  infer_module_kind (const classified_arguments&, user_settings&);
}

#endif // LIBWASIXCC_ARGUMENTS_HXX
