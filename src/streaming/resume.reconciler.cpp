#include "macros.hh"
#include "resume.reconciler.hh"

#include <vector>

stow::ResumeReconciler::ResumeReconciler(ObjectStore& store,
                                         std::string_view object_name,
                                         size_t page_size)
  : store_(store)
  , object_name_(object_name)
  , page_size_(page_size)
{
    EXPECT(!object_name_.empty(), "Object name must not be empty");
    EXPECT(page_size_ > 0, "Page size must be positive");
}

stow::Error
stow::ResumeReconciler::reconcile(std::unique_ptr<MultipartSession>& session_out,
                                  SeenParts& seen_out)
{
    session_out.reset();
    stored_bytes_ = 0;

    std::vector<UnfinishedUpload> uploads;
    if (Error error = store_.list_unfinished_uploads(object_name_, 1, uploads);
        error) {
        return error;
    }

    if (uploads.empty() || uploads.front().name != object_name_) {
        LOG_DEBUG("No unfinished upload of ", object_name_, " to resume");
        return {};
    }

    const UnfinishedUpload& upload = uploads.front();

    SeenParts seen;
    uint64_t stored_bytes = 0;
    uint32_t next_part_id = 1;
    while (true) {
        PartListing listing;
        if (Error error =
              store_.list_parts(upload, next_part_id, page_size_, listing);
            error) {
            return error;
        }

        for (const auto& part : listing.parts) {
            seen[part.part_id] = part.hash;
            stored_bytes += part.size;
        }

        if (listing.parts.empty() || listing.next_part_id == 0) {
            break;
        }

        if (listing.next_part_id <= next_part_id) {
            return { StowStatusCode_InternalError,
                     "Part listing of " + object_name_ +
                       " did not advance past part " +
                       std::to_string(next_part_id) };
        }
        next_part_id = listing.next_part_id;
    }

    LOG_INFO("Resuming upload ",
             upload.session_id,
             " of ",
             object_name_,
             " with ",
             seen.size(),
             " stored parts (",
             stored_bytes,
             " bytes)");

    if (Error error =
          store_.resume_multipart(upload, seen, stored_bytes, session_out);
        error) {
        return error;
    }

    seen_out = std::move(seen);
    stored_bytes_ = stored_bytes;

    return {};
}
