#ifndef TREELIGHT_FUNCTION_REF_HPP
#define TREELIGHT_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace treelight {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace treelight

#endif
