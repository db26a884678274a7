// file      : libwasixcc/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libwasixcc/diagnostics.hxx>

#include <libbutl/process-io.hxx>

using namespace std;
using namespace butl;

namespace wasixcc
{
  // Diagnostics state. Keep at the default until set from the settings.
  //
  uint16_t verb = 1;

  void
  init_diag (uint16_t v)
  {
    assert (v < verb_never);
    verb = v;
  }

  void
  print_process (const char* const* args)
  {
    diag_record dr (text);
    print_process (dr, args);
  }

  void
  print_process (diag_record& dr, const char* const* args)
  {
    dr << butl::process_args {args, 0};
  }

  void simple_prologue_base::
  operator() (const diag_record& r) const
  {
    if (type_ != nullptr)
      r << "wasixcc: " << type_ << ": ";

    if (mod_ != nullptr)
      r << mod_ << "::";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr, nullptr); // No type/frame.
  const fail_mark  fail  ("error");
  const fail_end   endf;
}
