#ifndef KENCLIENT_ENGINE_ABI_H
#define KENCLIENT_ENGINE_ABI_H

/* C entry points exported by the native engine library (libken).  The client
 * resolves them with dlsym, so only the symbol names and signatures below are
 * load-bearing.
 *
 * The engine checks nothing: callers must never pass a handle or pool of 0, a
 * destroyed handle or pool, a null array with a nonzero count, or a start
 * beyond count.  kenclient::Client and kenclient::Pool enforce this.
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* 0 is never a valid handle or pool. */
typedef uint64_t ken_handle_t;
typedef uint64_t ken_pool_t;

/* Load a model (ARPA or binary).  Returns 0 on failure and writes a
 * NUL-terminated message of at most error_size bytes to error. */
typedef ken_handle_t (*ken_construct_fn)(const char *file_name, char *error, size_t error_size);
/* Must not be called twice on the same handle. */
typedef void (*ken_destroy_fn)(ken_handle_t handle);
typedef int (*ken_order_fn)(ken_handle_t handle);
/* Map an external id to a vocabulary word.  Nonzero on success. */
typedef int (*ken_register_word_fn)(ken_handle_t handle, const char *word, int id);
/* log10 p(last word | preceding words).  count >= 1. */
typedef float (*ken_prob_fn)(ken_handle_t handle, const int *ids, size_t count);
typedef float (*ken_prob_for_string_fn)(ken_handle_t handle, const char *const *words, size_t count);
/* Sum of log10 p(ids[i] | ids[0..i)) for start <= i < count.  count >= 1 and
 * start <= count; start == count scores the empty suffix as 0. */
typedef float (*ken_prob_string_fn)(ken_handle_t handle, const int *ids, size_t count, size_t start);
typedef int (*ken_is_known_word_fn)(ken_handle_t handle, const char *word);
typedef int (*ken_is_lm_oov_fn)(ken_handle_t handle, int id);
/* buffer holds slots int64_t: slot 0 is the id count, the ids follow.  Negative
 * ids are non-terminals naming a state returned by ken_prob_rule.  The buffer
 * must outlive the pool. */
typedef ken_pool_t (*ken_create_pool_fn)(int64_t *buffer, size_t slots);
typedef void (*ken_destroy_pool_fn)(ken_pool_t pool);
/* High 32 bits: state.  Low 32 bits: IEEE-754 bits of the log10 probability. */
typedef uint64_t (*ken_prob_rule_fn)(ken_handle_t handle, ken_pool_t pool);
typedef float (*ken_estimate_rule_fn)(ken_handle_t handle, const int64_t *ids, size_t count);

#define KEN_CONSTRUCT_SYMBOL "ken_construct"
#define KEN_DESTROY_SYMBOL "ken_destroy"
#define KEN_ORDER_SYMBOL "ken_order"
#define KEN_REGISTER_WORD_SYMBOL "ken_register_word"
#define KEN_PROB_SYMBOL "ken_prob"
#define KEN_PROB_FOR_STRING_SYMBOL "ken_prob_for_string"
#define KEN_PROB_STRING_SYMBOL "ken_prob_string"
#define KEN_IS_KNOWN_WORD_SYMBOL "ken_is_known_word"
#define KEN_IS_LM_OOV_SYMBOL "ken_is_lm_oov"
#define KEN_CREATE_POOL_SYMBOL "ken_create_pool"
#define KEN_DESTROY_POOL_SYMBOL "ken_destroy_pool"
#define KEN_PROB_RULE_SYMBOL "ken_prob_rule"
#define KEN_ESTIMATE_RULE_SYMBOL "ken_estimate_rule"

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* KENCLIENT_ENGINE_ABI_H */
