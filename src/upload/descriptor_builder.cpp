#include "upload/descriptor_builder.hpp"
#include "common/errors.hpp"

HelperDocument DescriptorRequest::toJson() const {
    HelperDocument doc = HelperDocument::object();
    doc["source"] = source;
    doc["inspection"] = inspection;
    doc["target"] = target;
    doc["disk_sizes"] = diskSizes;
    doc["sparse"] = sparse;
    doc["output_format"] = outputFormat;
    doc["output_name"] = outputName;
    doc["storage_domain_uuid"] = storageDomainUuid;
    doc["disk_uuids"] = diskUuids;
    doc["volume_uuids"] = volumeUuids;
    doc["vm_uuid"] = vmUuid;
    doc["target_family"] = targetFamily;
    return doc;
}

HelperDescriptorBuilder::HelperDescriptorBuilder(std::shared_ptr<HelperInvoker> helpers)
    : helpers_(std::move(helpers)) {
}

std::string HelperDescriptorBuilder::build(const DescriptorRequest& request) {
    HelperParams params;
    params.set("descriptor", request.toJson());

    HelperResult result = helpers_->invoke(Helper::CreateOvf, params, {}, true);
    if (!result.succeeded()) {
        throw RemoteRejection("failed to create the VM descriptor, see earlier errors");
    }
    return requireString(*result.output, "ovf", helperName(Helper::CreateOvf));
}
