#ifndef o3skim_shared_object_h
#define o3skim_shared_object_h

#include <memory>

// convenience macro. every shared array/dataset/adapter should have the
// following forward declarations
#define O3SKIM_SHARED_OBJECT_FORWARD_DECL(_cls)         \
    class _cls;                                         \
    using p_##_cls = std::shared_ptr<_cls>;             \
    using const_p_##_cls = std::shared_ptr<const _cls>;

#endif
