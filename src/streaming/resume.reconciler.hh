#pragma once

#include "error.hh"
#include "object.store.hh"

#include <memory>
#include <string>

namespace stow {
/**
 * @brief Rebuilds the state of an interrupted multipart upload so that parts
 * already stored are not sent again.
 */
class ResumeReconciler
{
  public:
    ResumeReconciler(ObjectStore& store,
                     std::string_view object_name,
                     size_t page_size);

    /**
     * @brief Find the unfinished upload of the object and collect the hashes
     * of its stored parts.
     * @details Pagination is drained completely before returning. If there
     * is no unfinished upload of the object, @p session_out is left null
     * and no error is returned.
     * @param[out] session_out The reopened session, or null.
     * @param[out] seen_out Hashes of the stored parts, by part id.
     * @return An empty Error on success.
     */
    [[nodiscard]] Error reconcile(std::unique_ptr<MultipartSession>& session_out,
                                  SeenParts& seen_out);

    /** @brief Total size of the stored parts found by reconcile(). */
    uint64_t stored_bytes() const { return stored_bytes_; }

  private:
    ObjectStore& store_;
    const std::string object_name_;
    const size_t page_size_;

    uint64_t stored_bytes_{ 0 };
};
} // namespace stow
