#pragma once

/*!
 * @brief Internal invariant check. Terminates the process with a diagnostic when
 *        the condition does not hold. Never used for conditions a caller can
 *        provoke; those are reported with exceptions.
 */
void ___check(bool condition, const char *file, int line, const char *func, const char *message);
#define _check(condition, message) ___check(condition, __FILE__, __LINE__, __func__, message)
