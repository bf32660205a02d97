#pragma once

#include "PipelineConfig.h"
#include "drawlink/core/DiagramRequest.h"
#include "drawlink/style/IStyleResolver.h"

#include <string>

namespace drawlink {

/// End-to-end conversion of a diagram request into a draw.io link:
/// graph construction, containment layout, mxGraphModel export,
/// compression and URL assembly.
///
/// Each call is self-contained; an error anywhere aborts the call with no
/// partial output.
class DiagramPipeline {
public:
    /// @param styles Style resolver; must outlive the pipeline
    explicit DiagramPipeline(const IStyleResolver& styles);
    DiagramPipeline(const IStyleResolver& styles, PipelineOptions options);

    /// mxGraphModel XML for request
    std::string generateDocument(const DiagramRequest& request) const;

    /// draw.io link carrying the compressed document
    std::string generateUrl(const DiagramRequest& request) const;

    /// XML carried by a link produced by generateUrl()
    /// @throws CodecError if the link has no payload or it does not decode
    std::string decodeUrl(const std::string& url) const;

    const PipelineOptions& options() const { return options_; }

private:
    const IStyleResolver& styles_;
    PipelineOptions options_;
};

}  // namespace drawlink
