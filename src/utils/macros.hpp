/******************************************************************************/
/*  s3wire internal use                                                       */
/******************************************************************************/

#define LIBS3WIRE_UNUSED(object) (void) object

/******************************************************************************/

#if !defined S3WIRE_HAVE_NOEXCEPT && __cplusplus >= 201103L
#define S3WIRE_HAVE_NOEXCEPT
#endif

#if !defined S3WIRE_NOEXCEPT
#if defined S3WIRE_HAVE_NOEXCEPT
#define S3WIRE_NOEXCEPT noexcept
#else
#define S3WIRE_NOEXCEPT
#endif
#endif

#if !defined S3WIRE_OVERRIDE
#if defined S3WIRE_HAVE_NOEXCEPT
#define S3WIRE_OVERRIDE override
#else
#define S3WIRE_OVERRIDE
#endif
#endif

#if !defined S3WIRE_FINAL
#if defined S3WIRE_HAVE_NOEXCEPT
#define S3WIRE_FINAL final
#else
#define S3WIRE_FINAL
#endif
#endif

#if !defined S3WIRE_DEFAULT
#if defined S3WIRE_HAVE_NOEXCEPT
#define S3WIRE_DEFAULT = default;
#else
#define S3WIRE_DEFAULT                                                         \
    {                                                                          \
    }
#endif
#endif

#if !defined S3WIRE_NON_COPYABLE_NOR_MOVABLE
#if defined S3WIRE_HAVE_NOEXCEPT
#define S3WIRE_NON_COPYABLE_NOR_MOVABLE(classname)                             \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define S3WIRE_NON_COPYABLE_NOR_MOVABLE(classname)                             \
  private:                                                                     \
    classname (const classname &);                                             \
    classname &operator= (const classname &);
#endif
#endif

#if !defined S3WIRE_MOVE_ONLY
#define S3WIRE_MOVE_ONLY(classname)                                            \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;
#endif
