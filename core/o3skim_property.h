#ifndef o3skim_property_h
#define o3skim_property_h

/// @file

/** Generate set and get methods for the member variable NAME of type T.
 * Objects configured this way are set up before use and are not modified
 * while they run.
 */
#define O3SKIM_PROPERTY(T, NAME)                         \
                                                         \
/** Set the value of the NAME property */                \
void set_##NAME(const T &v)                              \
{                                                        \
    this->NAME = v;                                      \
}                                                        \
                                                         \
/** Get the value of the NAME property */                \
const T &get_##NAME() const                              \
{                                                        \
    return this->NAME;                                   \
}

/** Generate methods for the std::vector<T> member variable NAMEs. */
#define O3SKIM_VECTOR_PROPERTY(T, NAME)                                   \
                                                                          \
/** get the size of the NAME vector property */                           \
size_t get_number_of_##NAME##s () const                                   \
{                                                                         \
    return this->NAME##s.size();                                          \
}                                                                         \
                                                                          \
/** append to the NAME vector property */                                 \
void append_##NAME(const T &v)                                            \
{                                                                         \
    this->NAME##s.push_back(v);                                           \
}                                                                         \
                                                                          \
/** set the NAME vector property to a single value */                     \
void set_##NAME(const T &v)                                               \
{                                                                         \
    this->NAME##s = std::vector<T>({v});                                  \
}                                                                         \
                                                                          \
/** set the  NAME vector property */                                      \
void set_##NAME##s(const std::vector<T> &v)                               \
{                                                                         \
    this->NAME##s = v;                                                    \
}                                                                         \
                                                                          \
/** get the NAME vector property */                                       \
const std::vector<T> &get_##NAME##s() const                               \
{                                                                         \
    return this->NAME##s;                                                 \
}                                                                         \
                                                                          \
/** clear the NAME vector property */                                     \
void clear_##NAME##s()                                                    \
{                                                                         \
    this->NAME##s.clear();                                                \
}

#endif
