// file      : libwasixcc/settings.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBWASIXCC_SETTINGS_HXX
#define LIBWASIXCC_SETTINGS_HXX

#include <libwasixcc/types.hxx>
#include <libwasixcc/utility.hxx>

#include <libwasixcc/module-kind.hxx>

namespace wasixcc
{
  // User settings are specified out of band, either inline on the command
  // line as -s<NAME>=<value> or as the WASIXCC_<NAME> environment variable.
  // For any given name the first inline setting wins and the environment is
  // only consulted if there is none. The two sources are never combined,
  // including for the list settings.
  //
  // Recognized names:
  //
  // LLVM_LOCATION    directory with unsuffixed clang, wasm-ld, etc
  // SYSROOT          WASIX sysroot directory
  // COMPILER_FLAGS   list of extra compiler flags
  // LINKER_FLAGS     list of extra linker flags
  // WASM_OPT_FLAGS   list of extra wasm-opt flags
  // FORCE_WASM_OPT   bool, run wasm-opt even if otherwise disabled
  // MODULE_KIND      static-main, dynamic-main, shared-library, object-file
  // WASM_EXCEPTIONS  bool, use the wasm exception handling model
  // PIC              bool, compile position-independent code
  // INCLUDE_CPP_STD  bool, link the C++ standard library into executables
  // VERBOSITY        diagnostics verbosity level (0-6)
  //
  const char* const setting_env_prefix = "WASIXCC_";

  // Default major version suffix of the LLVM tools searched for in PATH
  // (clang-20, wasm-ld-20, etc).
  //
  const uint32_t default_llvm_version = 20;

  // Environment variable lookup. Return nullopt if the variable is not set.
  //
  using environment = function<optional<string> (const string& name)>;

  // Return the lookup function for the environment of this process.
  //
  environment
  process_environment ();

  // Return true if the argument is an inline setting, that is, has the
  // -s<NAME>=<value> form where NAME is a non-empty sequence of upper-case
  // letters, digits, and underscores. Note that -std=c++17 or -shared are
  // not settings.
  //
  bool
  setting_argument (const string&);

  // Partition the command line arguments into the inline settings (first)
  // and the pipeline arguments (second) preserving their relative order.
  //
  pair<strings, strings>
  separate_settings_arguments (const strings&);

  // Look up the setting value first in the inline settings and then in the
  // environment.
  //
  optional<string>
  lookup_setting (const char* name, const strings& settings, const environment&);

  // Parse the boolean setting value (1/true/yes or 0/false/no, case-
  // insensitive). Issue diagnostics naming the setting and throw failed if
  // the value is not recognized.
  //
  bool
  parse_bool_setting (const char* name, const string& value);

  // Parse the list setting value. Elements are separated with `:` which can
  // be escaped as `\:`. The whole value as well as every element is trimmed
  // and empty elements are dropped.
  //
  strings
  parse_list_setting (const string& value);

  // Location of the LLVM toolchain: either an explicit directory with the
  // unsuffixed tools or the PATH search with the major version suffix.
  //
  struct llvm_location
  {
    optional<dir_path> directory;
    uint32_t version = default_llvm_version;

    // Return <directory>/<tool> or <tool>-<version>.
    //
    path
    tool_path (const char* tool) const;
  };

  ostream&
  operator<< (ostream&, const llvm_location&);

  struct user_settings
  {
    llvm_location llvm;
    optional<dir_path> sysroot_location;

    strings compiler_flags;
    strings linker_flags;
    strings wasm_opt_flags;

    bool force_wasm_opt = false;
    bool wasm_exceptions = false;
    bool pic = false;

    // If absent, then the C++ standard library is linked when building a
    // C++ artifact.
    //
    optional<bool> include_cpp_std;

    // Explicit or inferred module kind. Inference during argument
    // classification only fills it in if absent.
    //
    optional<module_kind> kind;

    // Return the sysroot. Issue diagnostics and throw failed if it is not
    // set.
    //
    const dir_path&
    sysroot () const;

    module_kind
    effective_kind () const
    {
      return kind ? *kind : module_kind::static_main;
    }
  };

  ostream&
  operator<< (ostream&, const user_settings&);

  // Resolve all the recognized settings. Issue diagnostics and throw failed
  // if any value is invalid. Note that a missing sysroot is only diagnosed
  // by user_settings::sysroot().
  //
  user_settings
  resolve_settings (const strings& settings, const environment&);

  // Resolve only the toolchain location (for the binutils passthrough).
  //
  llvm_location
  resolve_llvm_location (const strings& settings, const environment&);

  // Resolve the diagnostics verbosity level (1 if unspecified).
  //
  uint16_t
  resolve_verbosity (const strings& settings, const environment&);
}

#endif // LIBWASIXCC_SETTINGS_HXX
