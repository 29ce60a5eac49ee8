#ifndef SQUALL_PERSIST_PERSIST_EXCEPTION_H
#define SQUALL_PERSIST_PERSIST_EXCEPTION_H

#include <squall/persist/persist_export_.h>
#include <stdexcept>

namespace squall {
namespace persist {


///\brief Decoded data is well formed, but describes an invalid value.
class squall_persist_export_ persist_exception
: public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
  ~persist_exception() override;
};


}} /* namespace squall::persist */

#endif /* SQUALL_PERSIST_PERSIST_EXCEPTION_H */
