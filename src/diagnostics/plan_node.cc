#include "plan_node.h"

#include <cstdlib>
#include <cxxabi.h>
#include <sstream>

namespace Estuary {

const char* PlanNodeTypeName(PlanNodeType type) {
	switch (type) {
		case PlanNodeType::INGRESS: return "Ingress";
		case PlanNodeType::UNION: return "Union";
	}
	return "Unknown";
}

std::string DemangledTypeName(const std::type_info& info) {
	int status = 0;
	char* demangled = abi::__cxa_demangle(info.name(), nullptr, nullptr, &status);
	if (status != 0 || demangled == nullptr) {
		return info.name();
	}
	std::string name(demangled);
	std::free(demangled);
	return name;
}

PlanNode::PlanNode(PlanNodeType type, const void* pipe_id, std::string key_type,
                   std::string payload_type, std::string error_messages)
	: type_(type),
	  pipe_id_(pipe_id),
	  key_type_(std::move(key_type)),
	  payload_type_(std::move(payload_type)),
	  error_messages_(std::move(error_messages)) {}

std::string PlanNode::ToString() const {
	std::string out;
	Render(out, 0);
	return out;
}

std::string PlanNode::Annotations() const {
	std::ostringstream os;
	os << "<" << key_type_ << ", " << payload_type_ << ">";
	if (!error_messages_.empty()) {
		os << " context=\"" << error_messages_ << "\"";
	}
	return os.str();
}

void PlanNode::Render(std::string& out, int level) const {
	out.append(static_cast<size_t>(level) * 2, ' ');
	out += PlanNodeTypeName(type_);
	out += ' ';
	out += Annotations();
	out += '\n';
	for (const auto& child : Children()) {
		if (child) child->Render(out, level + 1);
	}
}

IngressPlanNode::IngressPlanNode(const void* pipe_id, std::string key_type,
                                 std::string payload_type, std::string name)
	: PlanNode(PlanNodeType::INGRESS, pipe_id, std::move(key_type), std::move(payload_type), ""),
	  name_(std::move(name)) {}

std::string IngressPlanNode::Annotations() const {
	return PlanNode::Annotations() + " name=" + name_;
}

BinaryPlanNode::BinaryPlanNode(PlanNodeType type, Ptr left, Ptr right, const void* pipe_id,
                               std::string key_type, std::string payload_type,
                               std::string error_messages)
	: PlanNode(type, pipe_id, std::move(key_type), std::move(payload_type), std::move(error_messages)),
	  left_(std::move(left)),
	  right_(std::move(right)) {}

std::vector<PlanNode::Ptr> BinaryPlanNode::Children() const {
	return {left_, right_};
}

UnionPlanNode::UnionPlanNode(Ptr left, Ptr right, const void* pipe_id, std::string key_type,
                             std::string payload_type, bool is_generated, bool partitioned,
                             std::string error_messages)
	: BinaryPlanNode(PlanNodeType::UNION, std::move(left), std::move(right), pipe_id,
	                 std::move(key_type), std::move(payload_type), std::move(error_messages)),
	  is_generated_(is_generated),
	  partitioned_(partitioned) {}

std::string UnionPlanNode::Annotations() const {
	std::string out = PlanNode::Annotations();
	if (is_generated_) out += " generated";
	if (partitioned_) out += " partitioned";
	return out;
}

} // namespace Estuary
