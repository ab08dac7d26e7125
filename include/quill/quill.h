#ifndef QUILL_QUILL_H
#define QUILL_QUILL_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum quill_status {
  QUILL_OK = 0,
  QUILL_ERR_INVALID_ARGUMENT = 1,
  QUILL_ERR_NOT_FOUND = 2,
  QUILL_ERR_FOREIGN_CALL = 3,
  QUILL_ERR_RUNTIME = 4,
  QUILL_ERR_BACKEND = 5
} quill_status;

#ifdef __cplusplus
}
#endif

#endif  // QUILL_QUILL_H
