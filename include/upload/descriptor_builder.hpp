#pragma once

#include "upload/helper_invoker.hpp"
#include "upload/helper_params.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Inputs for the VM descriptor (OVF) of the new virtual machine.
struct DescriptorRequest {
    HelperDocument source;      // source VM metadata
    HelperDocument inspection;  // guest inspection results
    HelperDocument target;      // target hardware metadata
    std::vector<uint64_t> diskSizes;
    bool sparse{true};
    std::string outputFormat;
    std::string outputName;
    std::string storageDomainUuid;
    std::vector<std::string> diskUuids;
    std::vector<std::string> volumeUuids;
    std::string vmUuid;
    std::string targetFamily{"ovirt"};

    HelperDocument toJson() const;
};

class DescriptorBuilder {
public:
    virtual ~DescriptorBuilder() = default;
    virtual std::string build(const DescriptorRequest& request) = 0;
};

// Delegates descriptor generation to the createovf helper, which answers
// with {"ovf": "<document>"}.
class HelperDescriptorBuilder : public DescriptorBuilder {
public:
    explicit HelperDescriptorBuilder(std::shared_ptr<HelperInvoker> helpers);

    std::string build(const DescriptorRequest& request) override;

private:
    std::shared_ptr<HelperInvoker> helpers_;
};
